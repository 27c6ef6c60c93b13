#pragma once

#include <concord/schema/claim_outcome.hpp>
#include <cstdint>
#include <string>

namespace concord::schema {

template <uint16_t Version>
struct claim_response;

template <>
struct claim_response<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  claim_outcome_t outcome;
};

using claim_response_t = claim_response<1>;

}  // namespace concord::schema
