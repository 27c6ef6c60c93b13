#pragma once

#include <concord/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: manager state.
// Full snapshot of a validator manager: slot array (std::nullopt marks a
// tombstone), both masks as raw words, and the current claim.
namespace concord::schema {

template <uint16_t Version>
struct manager_state;

template <>
struct manager_state<1> final {
  uint16_t version{1};
  validator_id_t orchestrator{};
  std::vector<std::optional<validator_id_t>> slots;
  uint32_t consensus_goal{};
  uint32_t agreement{};
  claim_t current_claim{};

  bool operator==(const manager_state&) const = default;
};

using manager_state_t = manager_state<1>;

}  // namespace concord::schema
