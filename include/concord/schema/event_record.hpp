#pragma once

#include <array>
#include <concord/schema/claim_result.hpp>
#include <concord/schema/manager_event_type.hpp>
#include <concord/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: event record.
// Persisted event log entry. `log_hash` folds the previous entry's hash with
// this entry, so an indexer can detect gaps or rewrites.
namespace concord::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t epoch{};
  manager_event_type_t type{};
  std::optional<claim_result_t> result;
  std::array<claim_t, 2> claims{};
  std::array<validator_id_t, 2> validators{};
  hash32_t log_hash{};

  bool operator==(const event_record&) const = default;
};

using event_record_t = event_record<1>;

}  // namespace concord::schema
