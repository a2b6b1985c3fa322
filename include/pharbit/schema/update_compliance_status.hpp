#pragma once

#include <pharbit/schema/compliance_status.hpp>
#include <pharbit/schema/primitives.hpp>
#include <string>

// Compliance command: revise a compliance record in place.
namespace pharbit::schema {

template <uint16_t Version>
struct update_compliance_status;

template <>
struct update_compliance_status<1> final {
  uint16_t version{1};
  record_id_t record_id{};
  compliance_status_t status{compliance_status_t::pending};
  bool passed{};
  std::string notes;
};

using update_compliance_status_t = update_compliance_status<1>;

}  // namespace pharbit::schema
