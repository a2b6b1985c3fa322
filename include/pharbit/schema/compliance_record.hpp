#pragma once

#include <pharbit/schema/compliance_status.hpp>
#include <pharbit/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: compliance record.
// Supply chain workflow: one check-type evaluation of a batch. Status,
// passed and notes are updated in place by later reviews.
namespace pharbit::schema {

template <uint16_t Version>
struct compliance_record;

template <>
struct compliance_record<1> final {
  uint16_t version{1};
  record_id_t record_id{};
  batch_id_t batch_id;
  std::string check_type;
  compliance_status_t status{compliance_status_t::pending};
  bool passed{};
  identity_t auditor{};
  std::string notes;
  std::string findings;
  std::string corrective_actions;
  std::vector<std::string> evidence;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using compliance_record_t = compliance_record<1>;

}  // namespace pharbit::schema
