#pragma once

#include <concord/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace concord::validator {

/// Fixed-length array of validator slots with an identity -> index lookup.
///
/// Slot positions are permanent: removing a validator leaves a tombstone in
/// its slot and the index is never handed out again.
class roster final {
 public:
  using slot_t = std::optional<concord::schema::validator_id_t>;

  /// Build a roster where every slot is occupied.
  ///
  /// Fails (std::nullopt, `error` set) on an empty list, more than
  /// `max_size` entries, a zero identity, or a duplicate identity.
  static std::optional<roster> create(
      const std::vector<concord::schema::validator_id_t>& validators,
      std::size_t max_size,
      std::string& error);

  /// Rebuild a roster from persisted slots, tombstones included.
  static std::optional<roster> restore(const std::vector<slot_t>& slots,
                                       std::size_t max_size,
                                       std::string& error);

  /// Slot index of an occupied identity.
  std::optional<std::size_t> index_of(
      const concord::schema::validator_id_t& id) const;

  /// Identity at `index`, std::nullopt for a tombstone or out of range.
  slot_t at(std::size_t index) const;

  /// Tombstone the slot held by `id`. Returns the vacated index, or
  /// std::nullopt (and changes nothing) when `id` holds no slot.
  std::optional<std::size_t> remove(const concord::schema::validator_id_t& id);

  std::size_t size() const { return slots_.size(); }
  std::size_t occupied() const { return index_.size(); }
  const std::vector<slot_t>& slots() const { return slots_; }

 private:
  roster() = default;

  std::vector<slot_t> slots_;
  std::map<concord::schema::validator_id_t, std::size_t> index_;
};

}  // namespace concord::validator
