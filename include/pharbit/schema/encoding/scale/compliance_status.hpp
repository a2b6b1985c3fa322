#pragma once

#include <pharbit/schema/compliance_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    pharbit::schema,
    compliance_status_t,
    pharbit::schema::compliance_status_t::pending,
    pharbit::schema::compliance_status_t::passed,
    pharbit::schema::compliance_status_t::failed,
    pharbit::schema::compliance_status_t::requires_attention,
    pharbit::schema::compliance_status_t::under_review)
