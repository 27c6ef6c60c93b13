#pragma once
#include <concord/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace concord::blake3 {

concord::schema::hash32_t hash(const std::string_view& str);
concord::schema::hash32_t hash(const concord::schema::bytes_view_t& bytes);

/// Hash of `seed` followed by `bytes`; used to chain log entries.
concord::schema::hash32_t fold(const concord::schema::hash32_t& seed,
                               const concord::schema::bytes_view_t& bytes);

}  // namespace concord::blake3
