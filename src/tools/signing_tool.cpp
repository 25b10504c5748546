#include <boost/program_options.hpp>
#include <cosign/common/critical.hpp>
#include <cosign/crypto/recover.hpp>
#include <cosign/crypto/signing_key.hpp>
#include <cosign/digest/typed_data.hpp>
#include <cosign/execution/signature_verifier.hpp>
#include <cosign/tools/arguments.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace cosign::schema;

void print_help(const po::options_description& options) {
  std::cout << "usage: cosign_signer <command> [options]\n"
               "commands: keygen address domain-separator digest sign "
               "recover order\n"
            << options << std::endl;
}

cosign::crypto::signing_key load_key(const po::variables_map& vm) {
  auto key = cosign::crypto::signing_key::from_private_key(
      cosign::tools::get_hash32(vm, "private-key"));
  if (!key) {
    cosign::common::critical("--private-key is not a valid secp256k1 scalar");
  }
  return std::move(*key);
}

cosign::digest::domain_t make_domain(const po::variables_map& vm) {
  return cosign::digest::domain_t{
      .name = vm["name"].as<std::string>(),
      .chain_id = vm["chain-id"].as<uint64_t>(),
      .verifying_module = cosign::tools::get_address(vm, "module-address")};
}

hash32_t domain_separator_of(const po::variables_map& vm) {
  if (vm.contains("domain-separator")) {
    return cosign::tools::get_hash32(vm, "domain-separator");
  }
  return cosign::digest::domain_separator(make_domain(vm));
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"cosign_signer options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|address|domain-separator|digest|sign|recover|order")(
      "private-key", po::value<std::string>(), "32-byte private key hex")(
      "name", po::value<std::string>()->default_value("cosign"),
      "deployment name")("chain-id", po::value<uint64_t>()->default_value(1),
                         "chain identifier")(
      "module-address", po::value<std::string>(), "module address hex")(
      "domain-separator", po::value<std::string>(),
      "32-byte domain separator hex (instead of name/chain-id/module)")(
      "nonce", po::value<uint64_t>()->default_value(1),
      "module nonce the digest binds to")(
      "digest", po::value<std::string>(), "32-byte digest hex")(
      "signature", po::value<std::vector<std::string>>()->composing(),
      "65-byte r||s||v signature hex (repeatable)");
  cosign::tools::add_action_options(options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }


  if (command == "keygen") {
    auto key = cosign::crypto::signing_key::generate();
    std::cout << "private_key: "
              << cosign::tools::to_prefixed_hex(key.private_key()) << "\n"
              << "address: " << cosign::tools::to_prefixed_hex(key.address())
              << "\n";
    return 0;
  }

  if (command == "address") {
    std::cout << cosign::tools::to_prefixed_hex(load_key(vm).address())
              << "\n";
    return 0;
  }

  if (command == "domain-separator") {
    std::cout << cosign::tools::to_prefixed_hex(
                     cosign::digest::domain_separator(make_domain(vm)))
              << "\n";
    return 0;
  }

  if (command == "digest") {
    auto digest = cosign::digest::build_digest(domain_separator_of(vm),
                                               cosign::tools::make_action(vm),
                                               vm["nonce"].as<uint64_t>());
    std::cout << cosign::tools::to_prefixed_hex(digest) << "\n";
    return 0;
  }

  if (command == "sign") {
    auto signature =
        load_key(vm).sign(cosign::tools::get_hash32(vm, "digest"));
    std::cout << cosign::tools::to_prefixed_hex(to_bytes(signature)) << "\n";
    return 0;
  }

  if (command == "recover") {
    auto digest = cosign::tools::get_hash32(vm, "digest");
    auto signatures = cosign::tools::get_signatures(vm);
    if (signatures.size() != 1) {
      cosign::common::critical("recover takes exactly one --signature");
    }
    auto signer = cosign::crypto::recover_signer(digest, signatures.front());
    if (!signer) {
      std::cerr << "signature does not recover to any key\n";
      return 1;
    }
    std::cout << cosign::tools::to_prefixed_hex(*signer) << "\n";
    return 0;
  }

  if (command == "order") {
    auto ordered = cosign::execution::order_signatures(
        cosign::tools::get_hash32(vm, "digest"),
        cosign::tools::get_signatures(vm),
        cosign::execution::make_default_signer_recoverer());
    for (const auto& signature : ordered) {
      std::cout << cosign::tools::to_prefixed_hex(to_bytes(signature)) << "\n";
    }
    return 0;
  }

  std::cerr << "unknown command '" << command << "'\n";
  print_help(options);
  return 1;
}
