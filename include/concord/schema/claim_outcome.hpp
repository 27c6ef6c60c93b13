#pragma once

#include <array>
#include <concord/schema/claim_result.hpp>
#include <concord/schema/primitives.hpp>

// Schema type: claim outcome.
// The (result, claim pair, validator pair) triple returned by claim
// submission and dispute outcome. Unused positions hold the zero claim and
// the zero address.
namespace concord::schema {

struct claim_outcome_t final {
  claim_result_t result{claim_result_t::no_conflict};
  std::array<claim_t, 2> claims{};
  std::array<validator_id_t, 2> validators{};

  bool operator==(const claim_outcome_t&) const = default;
};

}  // namespace concord::schema
