#pragma once

#include <cstdint>

namespace concord::schema {

enum class manager_error_code : uint32_t {
  authorization_denied = 1,
  invalid_claim = 2,
  unknown_validator = 3,
  invalid_dispute_outcome = 4,
  invariant_violation = 5,
};

}  // namespace concord::schema
