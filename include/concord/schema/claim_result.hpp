#pragma once

#include <array>
#include <concord/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: claim result.
// Outcome of a claim submission or dispute outcome as observed by the
// orchestrator and by event log consumers.
namespace concord::schema {

enum class claim_result_t : uint8_t {
  no_conflict = 0,
  consensus = 1,
  conflict = 2,
};

inline constexpr auto kClaimResultNames =
    std::array<std::pair<std::string_view, claim_result_t>, 3>{
        std::pair{std::string_view{"no_conflict"}, claim_result_t::no_conflict},
        std::pair{std::string_view{"consensus"}, claim_result_t::consensus},
        std::pair{std::string_view{"conflict"}, claim_result_t::conflict}};

}  // namespace concord::schema
