#include <concord/schema/key/builder.hpp>
#include <concord/schema/key/engine_keys.hpp>

namespace concord::schema::key {

concord::schema::bytes_t make_key(const std::string_view key) {
  return builder{}.write(key).data;
}

concord::schema::bytes_t make_event_key(const uint64_t event_id) {
  return builder{}.write(kEventPrefix).write(event_id).data;
}

concord::schema::bytes_t make_finalized_epoch_key(const uint64_t epoch) {
  return builder{}.write(kFinalizedEpochPrefix).write(epoch).data;
}

}  // namespace concord::schema::key
