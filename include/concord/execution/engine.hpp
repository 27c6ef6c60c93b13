#pragma once

#include <concord/bitset/bitmask.hpp>
#include <concord/schema/claim_response.hpp>
#include <concord/schema/encoding/scale/encoder.hpp>
#include <concord/schema/epoch_response.hpp>
#include <concord/schema/event_record.hpp>
#include <concord/schema/finalized_epoch.hpp>
#include <concord/schema/primitives.hpp>
#include <concord/storage/rocksdb/storage.hpp>
#include <concord/validator/manager.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace concord::execution {

/// Receives each event after it has been durably written. Called outside the
/// engine lock, so it may query the engine.
using event_listener_t =
    std::function<void(const concord::schema::event_record_t& event)>;

/// Durable host of one validator manager.
///
/// Every successful mutating call commits the manager's new state, the event
/// it emitted, and (for epoch rollover) the finalized claim in a single
/// RocksDB batch. Rejected calls write nothing. Calls are serialized.
class engine final {
 public:
  /// Restore the manager from `storage` when it holds one, otherwise create
  /// it from `config` and persist the genesis state.
  ///
  /// An unusable configuration or corrupted persisted state is fatal.
  explicit engine(
      concord::schema::encoding::encoder<
          concord::schema::encoding::scale_encoder_tag>& encoder,
      concord::storage::storage<concord::storage::rocksdb_storage_tag>& storage,
      const concord::validator::manager_config& config);

  concord::schema::claim_response_t submit_claim(
      const concord::schema::validator_id_t& caller,
      const concord::schema::validator_id_t& validator,
      const concord::schema::claim_t& claim);

  concord::schema::claim_response_t resolve_dispute(
      const concord::schema::validator_id_t& caller,
      const concord::schema::validator_id_t& winner,
      const concord::schema::validator_id_t& loser,
      const concord::schema::claim_t& winning_claim);

  /// Close the current epoch. On success the response also carries the
  /// number of the epoch that was closed.
  concord::schema::epoch_response_t advance_epoch(
      const concord::schema::validator_id_t& caller);

  concord::bitset::bitmask agreement_mask() const;
  concord::bitset::bitmask consensus_goal_mask() const;
  concord::schema::claim_t current_claim() const;

  /// Number of the epoch currently accepting claims, starting at 0.
  uint64_t current_epoch() const;

  /// Id of the newest event, 0 when the log is empty.
  uint64_t last_event_id() const;

  /// BLAKE3 digest of the encoded manager state and epoch number.
  concord::schema::hash32_t state_root() const;

  concord::schema::manager_state_t state() const;

  /// Events with ids in [from_id, to_id].
  std::vector<concord::schema::event_record_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;

  std::optional<concord::schema::finalized_epoch_t> finalized_epoch(
      uint64_t epoch) const;

  /// Finalized epochs with numbers in [from_epoch, to_epoch].
  std::vector<concord::schema::finalized_epoch_t> history(
      uint64_t from_epoch,
      uint64_t to_epoch) const;

  void set_event_listener(event_listener_t listener);

 private:
  /// Turn the manager's pending notification into an event record, write it
  /// together with the current state. Requires `mutex_` held.
  concord::schema::event_record_t commit_event(
      std::optional<concord::schema::finalized_epoch_t> finalized);

  void load_persisted_state(const concord::validator::manager_config& config);

  mutable std::mutex mutex_;
  concord::schema::encoding::encoder<
      concord::schema::encoding::scale_encoder_tag>& encoder_;
  concord::storage::storage<concord::storage::rocksdb_storage_tag>& storage_;
  std::optional<concord::validator::manager> manager_;
  std::optional<concord::schema::manager_event_t> pending_event_;
  uint64_t epoch_{};
  uint64_t last_event_id_{};
  concord::schema::hash32_t last_log_hash_{};
  event_listener_t listener_;
};

}  // namespace concord::execution
