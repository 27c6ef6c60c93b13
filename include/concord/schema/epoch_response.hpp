#pragma once

#include <concord/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace concord::schema {

template <uint16_t Version>
struct epoch_response;

template <>
struct epoch_response<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  // Claim of the epoch that just closed, zero when nobody claimed.
  claim_t finalized_claim{};
  // Engine-assigned number of the epoch that just closed.
  uint64_t epoch{};
};

using epoch_response_t = epoch_response<1>;

}  // namespace concord::schema
