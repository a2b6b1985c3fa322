#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/role_id.hpp>

// Access registry command: take a role away from an identity.
namespace pharbit::schema {

template <uint16_t Version>
struct revoke_role;

template <>
struct revoke_role<1> final {
  uint16_t version{1};
  identity_t subject{};
  role_id_t role{role_id_t::producer};
};

using revoke_role_t = revoke_role<1>;

}  // namespace pharbit::schema
