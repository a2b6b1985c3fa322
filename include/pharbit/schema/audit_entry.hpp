#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: audit entry.
// Supply chain workflow: immutable audit history row. Corrections are new
// entries.
namespace pharbit::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  record_id_t entry_id{};
  batch_id_t batch_id;
  identity_t auditor{};
  std::string audit_type;
  std::string findings;
  std::string recommendations;
  std::string result;
  std::vector<std::string> evidence;
  timestamp_milliseconds_t created_at{};
};

using audit_entry_t = audit_entry<1>;

}  // namespace pharbit::schema
