#pragma once

#include <array>
#include <concord/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: manager event type.
// Identifies which mutating entry point produced an event log entry.
namespace concord::schema {

enum class manager_event_type_t : uint8_t {
  claim_received = 1,
  dispute_ended = 2,
  new_epoch = 3,
};

inline constexpr auto kManagerEventTypeNames =
    std::array<std::pair<std::string_view, manager_event_type_t>, 3>{
        std::pair{std::string_view{"claim_received"},
                  manager_event_type_t::claim_received},
        std::pair{std::string_view{"dispute_ended"},
                  manager_event_type_t::dispute_ended},
        std::pair{std::string_view{"new_epoch"},
                  manager_event_type_t::new_epoch}};

}  // namespace concord::schema
