#pragma once

#include <array>
#include <concord/schema/claim_result.hpp>
#include <concord/schema/manager_event_type.hpp>
#include <concord/schema/primitives.hpp>
#include <optional>

// Schema type: manager event.
// Notification raised by every successful mutating call. Epoch rollover
// carries no result and reports the finalized claim in claims[0].
namespace concord::schema {

struct manager_event_t final {
  manager_event_type_t type{};
  std::optional<claim_result_t> result;
  std::array<claim_t, 2> claims{};
  std::array<validator_id_t, 2> validators{};

  bool operator==(const manager_event_t&) const = default;
};

}  // namespace concord::schema
