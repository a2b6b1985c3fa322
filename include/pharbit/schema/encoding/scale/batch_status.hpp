#pragma once

#include <pharbit/schema/batch_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(pharbit::schema,
                             batch_status_t,
                             pharbit::schema::batch_status_t::produced,
                             pharbit::schema::batch_status_t::in_transit,
                             pharbit::schema::batch_status_t::at_distributor,
                             pharbit::schema::batch_status_t::at_pharmacy,
                             pharbit::schema::batch_status_t::dispensed,
                             pharbit::schema::batch_status_t::recalled,
                             pharbit::schema::batch_status_t::expired,
                             pharbit::schema::batch_status_t::destroyed)
