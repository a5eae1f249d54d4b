#pragma once

#include <provenance/schema/role_id.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(provenance::schema,
                             role_id_t,
                             provenance::schema::role_id_t::administrator,
                             provenance::schema::role_id_t::vendor,
                             provenance::schema::role_id_t::inspector,
                             provenance::schema::role_id_t::none)
