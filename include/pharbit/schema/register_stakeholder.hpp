#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/role_id.hpp>
#include <string>

// Stakeholder directory command: create an organisational record.
namespace pharbit::schema {

template <uint16_t Version>
struct register_stakeholder;

template <>
struct register_stakeholder<1> final {
  uint16_t version{1};
  identity_t subject{};
  std::string name;
  role_id_t role{role_id_t::producer};
};

using register_stakeholder_t = register_stakeholder<1>;

}  // namespace pharbit::schema
