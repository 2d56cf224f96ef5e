#pragma once

#include <tessera/config/genesis.hpp>
#include <tessera/custody/value_rail.hpp>
#include <tessera/encoding/scale/encoder.hpp>
#include <tessera/execution/signature_verifier.hpp>
#include <tessera/schema/app_info.hpp>
#include <tessera/schema/block_result.hpp>
#include <tessera/schema/commit_result.hpp>
#include <tessera/schema/event_record.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/query_result.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <tessera/schema/world_state.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tessera::execution {

/// Deterministic custody/auction state machine.
///
/// The engine validates signed transactions, executes each payload against a
/// scratch copy of the world state, persists committed state and the event
/// log, and serves read-only queries over the last committed state.
class engine final {
 public:
  /// Load committed state from `storage`, or build it from `genesis` when the
  /// store is empty.
  ///
  /// `require_strict_crypto` enables real signature verification; when
  /// false, signatures are not checked.
  engine(tessera::encoding::scale_encoder_t& encoder,
         tessera::storage::storage<tessera::storage::rocksdb_storage_tag>&
             storage,
         const tessera::config::genesis_t& genesis,
         bool require_strict_crypto = true);

  /// Admission check: decode and envelope validation only.
  tessera::schema::transaction_result_t check_transaction(
      const tessera::schema::bytes_view_t& raw_tx);

  /// Execute a block in order and compute its candidate state root.
  ///
  /// `block_time` is the "now" of every transaction in the block. Per-tx
  /// results are returned for failures too. A block whose height is not the
  /// next one, or whose time precedes the last commit, executes nothing and
  /// stages nothing; every tx carries invalid_block_height/invalid_block_time.
  tessera::schema::block_result_t finalize_block(
      uint64_t height,
      tessera::schema::timestamp_milliseconds_t block_time,
      const std::vector<tessera::schema::bytes_t>& txs);

  /// Persist the last finalized block.
  tessera::schema::commit_result_t commit();

  tessera::schema::app_info_t info() const;

  /// Execute a read-only query by route against committed state.
  tessera::schema::query_result_t query(
      std::string_view path,
      const tessera::schema::bytes_view_t& data);

  /// Persisted events with ids in `[from_id, to_id]`.
  std::vector<tessera::schema::event_record_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Recipient hook applied to every value payout, for recipients that run
  /// code when paid.
  void set_receive_hook(tessera::custody::receive_hook_t hook);

 private:
  /// Blocks must follow the last commit in height and not go back in time.
  std::optional<tessera::schema::transaction_result_t> validate_block(
      uint64_t height,
      tessera::schema::timestamp_milliseconds_t block_time) const;

  /// Validate envelope version, chain id, signature and nonce.
  tessera::schema::transaction_result_t validate_transaction(
      const tessera::schema::transaction_t& tx,
      const tessera::schema::world_state_t& world,
      std::string_view codespace) const;

  /// Run one payload against `world`, which is replaced only on success.
  tessera::schema::transaction_result_t execute_transaction(
      const tessera::schema::transaction_t& tx,
      tessera::schema::world_state_t& world,
      tessera::schema::timestamp_milliseconds_t block_time);

  /// BLAKE3 over the folded accepted-transaction hash and the world state.
  tessera::schema::hash32_t compute_state_root(
      const tessera::schema::hash32_t& rolling_hash,
      const tessera::schema::world_state_t& world);

  tessera::schema::query_result_t query_state(
      std::string_view path,
      const tessera::schema::bytes_view_t& data) const;

  void load_persisted_state(const tessera::config::genesis_t& genesis);

  mutable std::mutex mutex_;
  tessera::encoding::scale_encoder_t& encoder_;
  tessera::storage::storage<tessera::storage::rocksdb_storage_tag>& storage_;
  tessera::schema::world_state_t committed_world_;
  tessera::schema::world_state_t pending_world_;
  std::vector<tessera::schema::event_record_t> pending_events_;
  int64_t last_committed_height_{};
  tessera::schema::hash32_t last_committed_state_root_{};
  tessera::schema::timestamp_milliseconds_t last_block_time_{};
  int64_t pending_height_{};
  tessera::schema::hash32_t pending_state_root_{};
  tessera::schema::timestamp_milliseconds_t pending_block_time_{};
  uint64_t next_event_id_{1};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  tessera::custody::receive_hook_t receive_hook_;
};

/// Bytes an account signs: the envelope without its signature.
tessera::schema::bytes_t signing_bytes(const tessera::schema::transaction_t& tx);

}  // namespace tessera::execution
