#pragma once

#include <concord/schema/manager_event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    concord::schema,
    manager_event_type_t,
    concord::schema::manager_event_type_t::claim_received,
    concord::schema::manager_event_type_t::dispute_ended,
    concord::schema::manager_event_type_t::new_epoch)
