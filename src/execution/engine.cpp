#include <cosign/common/critical.hpp>
#include <cosign/digest/typed_data.hpp>
#include <cosign/execution/engine.hpp>
#include <cosign/execution/signature_verifier.hpp>
#include <cosign/schema/encoding/scale/transaction_event.hpp>
#include <cosign/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <thread>
#include <utility>

using namespace cosign::schema;

namespace {

using encoder_t = cosign::schema::encoding::encoder<
    cosign::schema::encoding::scale_encoder_tag>;
using key_value_entry_t = cosign::storage::key_value_entry_t;

constexpr std::string_view kExecuteCodespace{"cosign.execute"};
constexpr std::string_view kSetQuorumCodespace{"cosign.set_quorum"};
constexpr std::string_view kSetSignerCodespace{"cosign.set_signer"};

std::string_view codespace_of(const action_t& action) {
  switch (kind_of(action)) {
    case action_kind::execute:
      return kExecuteCodespace;
    case action_kind::update_quorum:
      return kSetQuorumCodespace;
    case action_kind::update_signer:
      return kSetSignerCodespace;
  }
  return kExecuteCodespace;
}

std::string prefixed_hex(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

transaction_event_attribute_t make_attribute(std::string_view key,
                                             std::string value,
                                             bool index = false) {
  return transaction_event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index};
}

transaction_event_t make_quorum_event(const uint64_t quorum) {
  auto event = transaction_event_t{};
  event.type = std::string{kQuorumUpdatedEvent};
  event.attributes.push_back(make_attribute("quorum", std::to_string(quorum)));
  return event;
}

transaction_event_t make_signer_event(const address_t& signer,
                                      const bool trust) {
  auto event = transaction_event_t{};
  event.type = std::string{kSignerUpdatedEvent};
  event.attributes.push_back(
      make_attribute("signer", prefixed_hex(signer), true));
  event.attributes.push_back(
      make_attribute("trust", trust ? "true" : "false"));
  return event;
}

key_value_entry_t make_entry(bytes_t key, bytes_t value) {
  return key_value_entry_t{std::move(key), std::move(value)};
}

// Marks the current thread as running the call executor.
class call_scope final {
 public:
  explicit call_scope(std::atomic<std::thread::id>& owner) : owner_{owner} {
    owner_.store(std::this_thread::get_id());
  }
  ~call_scope() { owner_.store(std::thread::id{}); }

  call_scope(const call_scope&) = delete;
  call_scope& operator=(const call_scope&) = delete;

 private:
  std::atomic<std::thread::id>& owner_;
};

}  // namespace

namespace cosign::execution {

engine::engine(encoder_t& encoder,
               cosign::storage::storage<cosign::storage::rocksdb_storage_tag>&
                   storage,
               const deployment_config& config)
    : encoder_{encoder},
      storage_{storage},
      domain_separator_{cosign::digest::domain_separator(config.domain)},
      signer_recoverer_{make_default_signer_recoverer()},
      call_executor_{make_rejecting_executor()} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing cosign module '{}' on chain {} at 0x{}",
               config.domain.name, config.domain.chain_id,
               to_hex(config.domain.verifying_module));

  auto persisted_domain = storage_.get<hash32_t>(
      encoder_, cosign::schema::key::make_key(cosign::schema::key::kDomainKey));
  if (!persisted_domain) {
    write_genesis(config);
  } else {
    if (*persisted_domain != domain_separator_) {
      cosign::common::critical(
          "store belongs to domain 0x{}, configured domain is 0x{}",
          to_hex(*persisted_domain), to_hex(domain_separator_));
    }
    load_persisted_state();
  }
  spdlog::info("Module ready: domain 0x{}, nonce {}, quorum {}",
               to_hex(domain_separator_), state_.nonce, state_.quorum);
}

void engine::write_genesis(const deployment_config& config) {
  spdlog::info("Empty store; writing genesis with {} signer(s), quorum {}",
               config.signers.size(), config.quorum);
  if (config.quorum == 0) {
    spdlog::warn("Quorum is 0; every action will be authorized unsigned");
  }

  auto genesis = module_state{};
  genesis.quorum = config.quorum;
  auto entries = std::vector<key_value_entry_t>{};
  auto sequence = uint64_t{};
  auto append_event = [&](transaction_event_t event) {
    event.sequence = ++sequence;
    entries.push_back(make_entry(
        cosign::schema::key::make_event_key(event.sequence),
        cosign::schema::encoding::scale::encode(encoder_, event)));
  };

  for (const auto& signer : config.signers) {
    if (!genesis.set_trust(signer, true)) {
      spdlog::warn("Duplicate genesis signer 0x{} ignored", to_hex(signer));
      continue;
    }
    entries.push_back(make_entry(cosign::schema::key::make_signer_key(signer),
                                 encoder_.encode(true)));
    append_event(make_signer_event(signer, true));
  }
  append_event(make_quorum_event(genesis.quorum));

  if (genesis.quorum > genesis.trusted.size()) {
    spdlog::warn("Quorum {} exceeds the {} trusted signer(s)", genesis.quorum,
                 genesis.trusted.size());
  }

  using namespace cosign::schema::key;
  entries.push_back(
      make_entry(make_key(kDomainKey), encoder_.encode(domain_separator_)));
  entries.push_back(
      make_entry(make_key(kQuorumKey), encoder_.encode(genesis.quorum)));
  entries.push_back(
      make_entry(make_key(kNonceKey), encoder_.encode(genesis.nonce)));
  entries.push_back(make_entry(make_key(kEventSeqKey), encoder_.encode(sequence)));
  storage_.commit(entries);

  state_ = std::move(genesis);
  last_event_sequence_ = sequence;
}

void engine::load_persisted_state() {
  using namespace cosign::schema::key;
  spdlog::debug("Loading persisted module state");

  auto quorum = storage_.get<uint64_t>(encoder_, make_key(kQuorumKey));
  auto nonce = storage_.get<uint64_t>(encoder_, make_key(kNonceKey));
  auto sequence = storage_.get<uint64_t>(encoder_, make_key(kEventSeqKey));
  if (!quorum || !nonce || !sequence) {
    cosign::common::critical("store is missing module state");
  }

  auto loaded = module_state{};
  loaded.quorum = *quorum;
  loaded.nonce = *nonce;
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_key(kSignerKeyPrefix))) {
    auto signer = parse_signer_key(key);
    auto trusted = encoder_.try_decode<bool>(value);
    if (!signer || !trusted) {
      cosign::common::critical("malformed signer entry in store");
    }
    if (*trusted) {
      loaded.trusted.insert(*signer);
    }
  }

  state_ = std::move(loaded);
  last_event_sequence_ = *sequence;
  spdlog::debug("Loaded {} trusted signer(s) and {} event(s)",
                state_.trusted.size(), last_event_sequence_);
}

transaction_result_t engine::execute(const address_t& target,
                                     const amount_t& value,
                                     const bytes_view_t& payload,
                                     const std::vector<signature_t>& signatures) {
  return submit(execute_t{.target = target,
                          .value = value,
                          .payload = make_bytes(payload)},
                signatures);
}

transaction_result_t engine::set_quorum(
    const uint64_t quorum,
    const std::vector<signature_t>& signatures) {
  return submit(update_quorum_t{.quorum = quorum}, signatures);
}

transaction_result_t engine::set_signer(
    const address_t& signer,
    const bool trust,
    const std::vector<signature_t>& signatures) {
  return submit(update_signer_t{.signer = signer, .trust = trust}, signatures);
}

transaction_result_t engine::submit(const action_t& action,
                                    const std::vector<signature_t>& signatures) {
  auto codespace = codespace_of(action);
  if (called_from_call_executor()) {
    spdlog::warn("Rejected {} submitted from inside the call executor",
                 to_string(kind_of(action)));
    return make_error_result(transaction_error_code::reentrant_call, codespace,
                             "actions cannot be submitted during a call");
  }
  auto lock = std::scoped_lock{mutex_};

  auto working = state_;
  auto nonce = working.use_nonce();
  auto digest =
      cosign::digest::build_digest(domain_separator_, action, nonce);

  auto failure =
      verify_signatures(working, digest, signatures, signer_recoverer_);
  if (failure) {
    spdlog::warn("Rejected {} at nonce {}: {} (signature {}, signer 0x{})",
                 to_string(kind_of(action)), nonce, to_string(failure->code),
                 failure->index, to_hex(failure->signer));
    return make_error_result(
        failure->code, codespace,
        fmt::format("signature {} rejected for nonce {}", failure->index,
                    nonce));
  }

  auto event = transaction_event_t{};
  if (auto error = apply_effect(action, codespace, working, event)) {
    return std::move(*error);
  }
  event.sequence = last_event_sequence_ + 1;

  using namespace cosign::schema::key;
  auto entries = std::vector<key_value_entry_t>{};
  entries.push_back(
      make_entry(make_key(kNonceKey), encoder_.encode(working.nonce)));
  entries.push_back(
      make_entry(make_key(kQuorumKey), encoder_.encode(working.quorum)));
  if (const auto* update = std::get_if<update_signer_t>(&action)) {
    entries.push_back(make_entry(make_signer_key(update->signer),
                                 encoder_.encode(update->trust)));
  }
  entries.push_back(
      make_entry(make_key(kEventSeqKey), encoder_.encode(event.sequence)));
  entries.push_back(make_entry(
      make_event_key(event.sequence),
      cosign::schema::encoding::scale::encode(encoder_, event)));
  storage_.commit(entries);

  state_ = std::move(working);
  last_event_sequence_ = event.sequence;
  spdlog::info("Applied {} at nonce {} (event {})", to_string(kind_of(action)),
               nonce, event.sequence);

  auto result = transaction_result_t{};
  result.info = fmt::format("{} applied at nonce {}",
                            to_string(kind_of(action)), nonce);
  result.codespace = std::string{codespace};
  result.events.push_back(std::move(event));
  return result;
}

std::optional<transaction_result_t> engine::apply_effect(
    const action_t& action,
    const std::string_view codespace,
    module_state& state,
    transaction_event_t& event) {
  auto error = std::optional<transaction_result_t>{};
  std::visit(
      overloaded{
          [&](const execute_t& call) {
            auto succeeded = false;
            try {
              auto scope = call_scope{call_thread_};
              succeeded = call_executor_(call.target, call.value,
                                         make_bytes_view(call.payload));
            } catch (const std::exception& e) {
              spdlog::error("Call executor threw: {}", e.what());
            }
            if (!succeeded) {
              spdlog::warn("Call to 0x{} failed; rolling back",
                           to_hex(call.target));
              error = make_error_result(
                  transaction_error_code::execution_failed, codespace,
                  fmt::format("call to 0x{} failed", to_hex(call.target)));
              return;
            }
            event.type = std::string{kExecutedEvent};
            event.attributes.push_back(
                make_attribute("target", prefixed_hex(call.target), true));
            event.attributes.push_back(
                make_attribute("value", cosign::schema::to_string(call.value)));
            event.attributes.push_back(
                make_attribute("payload", prefixed_hex(call.payload)));
          },
          [&](const update_quorum_t& update) {
            state.quorum = update.quorum;
            if (update.quorum == 0) {
              spdlog::warn(
                  "Quorum set to 0; every action will be authorized unsigned");
            } else if (update.quorum > state.trusted.size()) {
              spdlog::warn("Quorum {} exceeds the {} trusted signer(s)",
                           update.quorum, state.trusted.size());
            }
            event = make_quorum_event(update.quorum);
          },
          [&](const update_signer_t& update) {
            if (!state.set_trust(update.signer, update.trust)) {
              spdlog::info("Signer 0x{} already {}", to_hex(update.signer),
                           update.trust ? "trusted" : "untrusted");
            }
            event = make_signer_event(update.signer, update.trust);
          }},
      action);
  return error;
}

bool engine::called_from_call_executor() const {
  return call_thread_.load() == std::this_thread::get_id();
}

std::unique_lock<std::mutex> engine::lock_unless_reentrant() const {
  if (called_from_call_executor()) {
    return std::unique_lock<std::mutex>{};
  }
  return std::unique_lock<std::mutex>{mutex_};
}

uint64_t engine::nonce() const {
  auto lock = lock_unless_reentrant();
  return state_.nonce;
}

uint64_t engine::quorum() const {
  auto lock = lock_unless_reentrant();
  return state_.quorum;
}

bool engine::is_signer(const address_t& signer) const {
  auto lock = lock_unless_reentrant();
  return state_.is_trusted(signer);
}

const hash32_t& engine::domain_separator() const {
  return domain_separator_;
}

hash32_t engine::digest(const action_t& action) const {
  auto lock = lock_unless_reentrant();
  return cosign::digest::build_digest(domain_separator_, action, state_.nonce);
}

std::vector<transaction_event_t> engine::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto lock = lock_unless_reentrant();
  auto out = std::vector<transaction_event_t>{};
  if (from_sequence > to_sequence) {
    return out;
  }
  auto rows = storage_.list_range(
      cosign::schema::key::make_event_key(from_sequence),
      cosign::schema::key::make_event_key(to_sequence));
  out.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    auto event = cosign::schema::encoding::scale::try_decode_event(encoder_,
                                                                    value);
    if (!event) {
      cosign::common::critical("malformed event in store");
    }
    out.push_back(std::move(*event));
  }
  return out;
}

uint64_t engine::last_event_sequence() const {
  auto lock = lock_unless_reentrant();
  return last_event_sequence_;
}

void engine::set_signer_recoverer(signer_recoverer_t recoverer) {
  if (called_from_call_executor()) {
    spdlog::error("Signer recoverer cannot be replaced during a call");
    return;
  }
  auto lock = std::scoped_lock{mutex_};
  signer_recoverer_ = std::move(recoverer);
}

void engine::set_call_executor(call_executor_t executor) {
  if (called_from_call_executor()) {
    spdlog::error("Call executor cannot be replaced during a call");
    return;
  }
  auto lock = std::scoped_lock{mutex_};
  call_executor_ = std::move(executor);
}

}  // namespace cosign::execution
