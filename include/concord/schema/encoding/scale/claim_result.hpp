#pragma once

#include <concord/schema/claim_result.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(concord::schema,
                             claim_result_t,
                             concord::schema::claim_result_t::no_conflict,
                             concord::schema::claim_result_t::consensus,
                             concord::schema::claim_result_t::conflict)
