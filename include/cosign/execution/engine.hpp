#pragma once

#include <cosign/execution/call_executor.hpp>
#include <cosign/execution/deployment_config.hpp>
#include <cosign/execution/module_state.hpp>
#include <cosign/execution/signer_recoverer.hpp>
#include <cosign/schema/action.hpp>
#include <cosign/schema/encoding/scale/encoder.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/transaction_event.hpp>
#include <cosign/schema/transaction_result.hpp>
#include <cosign/storage/rocksdb/storage.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace cosign::execution {

/// Multi-signature authorization module.
///
/// Every state-changing operation binds its digest to the current nonce,
/// checks `quorum` ascending signatures from trusted signers, applies its
/// effect and persists state plus one event in a single write batch. Any
/// failure leaves state, nonce, event log and storage untouched.
///
/// The call executor runs while the module is locked. Reads it makes on the
/// same thread see the state committed before the action under way; actions
/// it submits fail with `reentrant_call`.
class engine final {
 public:
  /// Open the module on `storage`.
  ///
  /// An empty store is seeded from `config` (signers, quorum, nonce 1). A
  /// store written for a different domain is fatal.
  engine(cosign::schema::encoding::encoder<
             cosign::schema::encoding::scale_encoder_tag>& encoder,
         cosign::storage::storage<cosign::storage::rocksdb_storage_tag>& storage,
         const deployment_config& config);

  /// Forward `value` and `payload` to `target`; emits `Executed`.
  cosign::schema::transaction_result_t execute(
      const cosign::schema::address_t& target,
      const cosign::schema::amount_t& value,
      const cosign::schema::bytes_view_t& payload,
      const std::vector<cosign::schema::signature_t>& signatures);

  /// Replace the quorum; emits `QuorumUpdated`. The new value applies from
  /// the next action on.
  cosign::schema::transaction_result_t set_quorum(
      uint64_t quorum,
      const std::vector<cosign::schema::signature_t>& signatures);

  /// Trust or distrust `signer`; emits `SignerUpdated`.
  cosign::schema::transaction_result_t set_signer(
      const cosign::schema::address_t& signer,
      bool trust,
      const std::vector<cosign::schema::signature_t>& signatures);

  /// Authorize and apply any action. `execute`, `set_quorum` and
  /// `set_signer` forward here. The result code is 0 on success or a
  /// `transaction_error_code`; rejected actions do not consume the nonce.
  cosign::schema::transaction_result_t submit(
      const cosign::schema::action_t& action,
      const std::vector<cosign::schema::signature_t>& signatures);

  /// Nonce the next action's digest is bound to. Starts at 1.
  uint64_t nonce() const;
  /// Number of signatures the next action must carry.
  uint64_t quorum() const;
  bool is_signer(const cosign::schema::address_t& signer) const;
  const cosign::schema::hash32_t& domain_separator() const;

  /// Digest signers must sign for `action` to be accepted next.
  cosign::schema::hash32_t digest(const cosign::schema::action_t& action) const;

  /// Persisted events with sequence in [from_sequence, to_sequence].
  std::vector<cosign::schema::transaction_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;
  /// Sequence of the newest persisted event, 0 when the log is empty.
  uint64_t last_event_sequence() const;

  /// Replace the recovery seam used to check signatures. Ignored when called
  /// from inside the call executor.
  void set_signer_recoverer(signer_recoverer_t recoverer);
  /// Replace the component that performs `execute` calls. Defaults to one
  /// that rejects every call. Ignored when called from inside the call
  /// executor.
  void set_call_executor(call_executor_t executor);

 private:
  void write_genesis(const deployment_config& config);
  void load_persisted_state();

  bool called_from_call_executor() const;
  /// Lock `mutex_` unless the caller is the call executor, whose thread
  /// already holds it.
  std::unique_lock<std::mutex> lock_unless_reentrant() const;

  /// Apply `effect` to `state`. Returns an error result when the effect
  /// itself failed (only the external call can).
  std::optional<cosign::schema::transaction_result_t> apply_effect(
      const cosign::schema::action_t& action,
      std::string_view codespace,
      module_state& state,
      cosign::schema::transaction_event_t& event);

  mutable std::mutex mutex_;
  std::atomic<std::thread::id> call_thread_{};
  cosign::schema::encoding::encoder<
      cosign::schema::encoding::scale_encoder_tag>& encoder_;
  cosign::storage::storage<cosign::storage::rocksdb_storage_tag>& storage_;
  cosign::schema::hash32_t domain_separator_{};
  module_state state_;
  uint64_t last_event_sequence_{};
  signer_recoverer_t signer_recoverer_;
  call_executor_t call_executor_;
};

}  // namespace cosign::execution
