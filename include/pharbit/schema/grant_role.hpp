#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/role_id.hpp>

// Access registry command: give an identity a role.
namespace pharbit::schema {

template <uint16_t Version>
struct grant_role;

template <>
struct grant_role<1> final {
  uint16_t version{1};
  identity_t subject{};
  role_id_t role{role_id_t::producer};
};

using grant_role_t = grant_role<1>;

}  // namespace pharbit::schema
