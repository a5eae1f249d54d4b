#pragma once

#include <provenance/schema/batch_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(provenance::schema,
                             batch_status_t,
                             provenance::schema::batch_status_t::created,
                             provenance::schema::batch_status_t::approved,
                             provenance::schema::batch_status_t::certified,
                             provenance::schema::batch_status_t::not_found)
