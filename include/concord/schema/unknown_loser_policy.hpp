#pragma once

#include <array>
#include <concord/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: unknown loser policy.
// Decides what a dispute outcome does when the losing identity no longer
// holds a slot.
namespace concord::schema {

enum class unknown_loser_policy : uint8_t {
  // Skip the removal step and keep evaluating the outcome.
  skip = 0,
  // Fail the whole call with unknown_validator.
  reject = 1,
};

inline constexpr auto kUnknownLoserPolicyNames =
    std::array<std::pair<std::string_view, unknown_loser_policy>, 2>{
        std::pair{std::string_view{"skip"}, unknown_loser_policy::skip},
        std::pair{std::string_view{"reject"}, unknown_loser_policy::reject}};

template <>
inline std::optional<unknown_loser_policy> try_from_string(
    const std::string_view value) {
  return from_string(value, kUnknownLoserPolicyNames);
}

}  // namespace concord::schema
