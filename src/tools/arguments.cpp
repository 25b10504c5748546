#include <cosign/common/critical.hpp>
#include <cosign/tools/arguments.hpp>

#include <ostream>

using namespace cosign::schema;
namespace po = boost::program_options;

namespace cosign::tools {

void add_action_options(po::options_description& options) {
  options.add_options()("action", po::value<std::string>(),
                        "execute|set-quorum|set-signer")(
      "target", po::value<std::string>(), "call target address hex")(
      "value", po::value<std::string>()->default_value("0"),
      "call value, decimal uint256")(
      "payload", po::value<std::string>()->default_value(""),
      "call payload hex")("new-quorum", po::value<uint64_t>(),
                          "quorum to install")(
      "address", po::value<std::string>(), "signer address hex")(
      "trust", po::value<bool>()->default_value(true),
      "trust (1) or distrust (0) the signer");
}

action_t make_action(const po::variables_map& vm) {
  if (!vm.contains("action")) {
    cosign::common::critical("missing --action");
  }
  auto name = vm["action"].as<std::string>();
  auto kind = try_make_action_kind(name);
  if (!kind) {
    cosign::common::critical("unknown action '{}'", name);
  }
  return make_action(vm, *kind);
}

action_t make_action(const po::variables_map& vm, const action_kind kind) {
  switch (kind) {
    case action_kind::execute: {
      auto value_text = vm["value"].as<std::string>();
      auto value = try_make_amount(value_text);
      if (!value) {
        cosign::common::critical("invalid --value '{}'", value_text);
      }
      auto payload = try_from_hex(vm["payload"].as<std::string>());
      if (!payload) {
        cosign::common::critical("--payload must be hex");
      }
      return execute_t{.target = get_address(vm, "target"),
                       .value = *value,
                       .payload = std::move(*payload)};
    }
    case action_kind::update_quorum:
      if (!vm.contains("new-quorum")) {
        cosign::common::critical("missing --new-quorum");
      }
      return update_quorum_t{.quorum = vm["new-quorum"].as<uint64_t>()};
    case action_kind::update_signer:
      return update_signer_t{.signer = get_address(vm, "address"),
                             .trust = vm["trust"].as<bool>()};
  }
  cosign::common::critical("unsupported action kind");
}

address_t get_address(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    cosign::common::critical("missing --{}", name);
  }
  auto text = vm[name].as<std::string>();
  auto address = try_make_address(text);
  if (!address) {
    cosign::common::critical("--{} must be 20 bytes of hex, got '{}'", name,
                             text);
  }
  return *address;
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    cosign::common::critical("missing --{}", name);
  }
  auto text = vm[name].as<std::string>();
  auto hash = try_make_hash32(text);
  if (!hash) {
    cosign::common::critical("--{} must be 32 bytes of hex, got '{}'", name,
                             text);
  }
  return *hash;
}

std::vector<signature_t> get_signatures(const po::variables_map& vm) {
  auto signatures = std::vector<signature_t>{};
  if (!vm.contains("signature")) {
    return signatures;
  }
  for (const auto& text : vm["signature"].as<std::vector<std::string>>()) {
    auto bytes = try_from_hex(text);
    auto signature =
        bytes ? make_signature(*bytes) : std::optional<signature_t>{};
    if (!signature) {
      cosign::common::critical("signature must be 65 bytes of hex, got '{}'",
                               text);
    }
    signatures.push_back(*signature);
  }
  return signatures;
}

std::string to_prefixed_hex(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

void print_event(std::ostream& out, const transaction_event_t& event) {
  out << "#" << event.sequence << " " << event.type;
  for (const auto& attribute : event.attributes) {
    out << " " << attribute.key << "=" << attribute.value;
  }
  out << "\n";
}

}  // namespace cosign::tools
