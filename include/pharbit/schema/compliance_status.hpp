#pragma once

#include <pharbit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: compliance status.
// Supply chain workflow: outcome of one compliance check. No transition
// graph; re-review may move a record between any two states.
namespace pharbit::schema {

enum class compliance_status_t : uint8_t {
  pending = 0,
  passed = 1,
  failed = 2,
  requires_attention = 3,
  under_review = 4
};

inline constexpr auto kComplianceStatusMappings = std::array{
    std::pair<std::string_view, compliance_status_t>{
        "pending", compliance_status_t::pending},
    std::pair<std::string_view, compliance_status_t>{
        "passed", compliance_status_t::passed},
    std::pair<std::string_view, compliance_status_t>{
        "failed", compliance_status_t::failed},
    std::pair<std::string_view, compliance_status_t>{
        "requires_attention", compliance_status_t::requires_attention},
    std::pair<std::string_view, compliance_status_t>{
        "under_review", compliance_status_t::under_review}};

template <>
inline std::optional<compliance_status_t>
try_from_string<compliance_status_t>(const std::string_view value) {
  return from_string(value, kComplianceStatusMappings);
}

inline constexpr std::string_view to_string(const compliance_status_t value) {
  return to_string(value, kComplianceStatusMappings).value_or("unknown");
}

inline constexpr bool is_known(const compliance_status_t value) {
  return to_string(value, kComplianceStatusMappings).has_value();
}

}  // namespace pharbit::schema
