#pragma once

#include <pharbit/schema/role_id.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(pharbit::schema,
                             role_id_t,
                             pharbit::schema::role_id_t::admin,
                             pharbit::schema::role_id_t::registrar,
                             pharbit::schema::role_id_t::producer,
                             pharbit::schema::role_id_t::distributor,
                             pharbit::schema::role_id_t::retailer,
                             pharbit::schema::role_id_t::sensor_device,
                             pharbit::schema::role_id_t::inspector,
                             pharbit::schema::role_id_t::auditor,
                             pharbit::schema::role_id_t::regulator,
                             pharbit::schema::role_id_t::governance_owner)
