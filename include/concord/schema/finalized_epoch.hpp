#pragma once

#include <concord/schema/primitives.hpp>
#include <cstdint>

// Schema type: finalized epoch.
// Claim handed downstream when an epoch closes, keyed by epoch number.
namespace concord::schema {

template <uint16_t Version>
struct finalized_epoch;

template <>
struct finalized_epoch<1> final {
  uint16_t version{1};
  uint64_t epoch{};
  claim_t claim{};
  uint64_t event_id{};

  bool operator==(const finalized_epoch&) const = default;
};

using finalized_epoch_t = finalized_epoch<1>;

}  // namespace concord::schema
