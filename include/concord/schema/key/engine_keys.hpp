#pragma once

#include <concord/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Canonical key layout for manager state, the event log, and finalized
// epochs.
namespace concord::schema::key {

inline constexpr std::string_view kManagerStateKey{"SYS|STATE|MANAGER"};
inline constexpr std::string_view kEpochKey{"SYS|STATE|EPOCH"};
inline constexpr std::string_view kEventHeadKey{"SYS|STATE|EVENT_HEAD"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kFinalizedEpochPrefix{"SYS|EPOCH|"};

concord::schema::bytes_t make_key(std::string_view key);
concord::schema::bytes_t make_event_key(uint64_t event_id);
concord::schema::bytes_t make_finalized_epoch_key(uint64_t epoch);

}  // namespace concord::schema::key
