#pragma once

#include <pharbit/schema/primitives.hpp>
#include <string>
#include <vector>

// Compliance command: append an immutable audit entry.
namespace pharbit::schema {

template <uint16_t Version>
struct record_audit;

template <>
struct record_audit<1> final {
  uint16_t version{1};
  batch_id_t batch_id;
  std::string audit_type;
  std::string findings;
  std::string recommendations;
  std::string result;
  std::vector<std::string> evidence;
};

using record_audit_t = record_audit<1>;

}  // namespace pharbit::schema
