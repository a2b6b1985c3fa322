#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>
#include <vector>

// Compliance command: open a compliance record for a batch.
namespace pharbit::schema {

template <uint16_t Version>
struct add_compliance_check;

template <>
struct add_compliance_check<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  std::string check_type;
  std::string notes;
  std::string findings;
  std::string corrective_actions;
  std::vector<std::string> evidence;
};

using add_compliance_check_t = add_compliance_check<1>;

}  // namespace pharbit::schema
