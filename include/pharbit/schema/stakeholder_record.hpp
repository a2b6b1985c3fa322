#pragma once

#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/role_id.hpp>
#include <string>

// Schema type: stakeholder record.
// Supply chain workflow: organisational identity of a participant. Never
// deleted; deactivation is the only way out.
namespace pharbit::schema {

template <uint16_t Version>
struct stakeholder_record;

template <>
struct stakeholder_record<1> final {
  uint16_t version{1};
  identity_t identity{};
  std::string name;
  role_id_t role{role_id_t::producer};
  bool kyc_completed{};
  std::string kyc_reference;
  bool active{true};
  timestamp_milliseconds_t registered_at{};
  timestamp_milliseconds_t updated_at{};
};

using stakeholder_record_t = stakeholder_record<1>;

}  // namespace pharbit::schema
