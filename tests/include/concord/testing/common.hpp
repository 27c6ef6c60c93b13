#pragma once

#include <concord/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace concord::testing {

inline concord::schema::claim_t make_claim(const uint8_t seed) {
  auto out = concord::schema::claim_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline concord::schema::validator_id_t make_validator(const uint8_t seed) {
  auto id = concord::schema::validator_id_t{};
  id[0] = seed;
  id[19] = 0xA5;
  return id;
}

inline concord::schema::validator_id_t make_orchestrator() {
  auto id = concord::schema::validator_id_t{};
  id.fill(0xEE);
  return id;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace concord::testing
