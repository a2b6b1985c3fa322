#pragma once

#include <pharbit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Supply chain workflow: capability labels held by identities. Roles are
// non-exclusive; one identity may hold several.
namespace pharbit::schema {

enum class role_id_t : uint8_t {
  admin = 0,
  registrar = 1,
  producer = 2,
  distributor = 3,
  retailer = 4,
  sensor_device = 5,
  inspector = 6,
  auditor = 7,
  regulator = 8,
  governance_owner = 9
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"registrar", role_id_t::registrar},
    std::pair<std::string_view, role_id_t>{"producer", role_id_t::producer},
    std::pair<std::string_view, role_id_t>{"distributor",
                                           role_id_t::distributor},
    std::pair<std::string_view, role_id_t>{"retailer", role_id_t::retailer},
    std::pair<std::string_view, role_id_t>{"sensor_device",
                                           role_id_t::sensor_device},
    std::pair<std::string_view, role_id_t>{"inspector", role_id_t::inspector},
    std::pair<std::string_view, role_id_t>{"auditor", role_id_t::auditor},
    std::pair<std::string_view, role_id_t>{"regulator", role_id_t::regulator},
    std::pair<std::string_view, role_id_t>{"governance_owner",
                                           role_id_t::governance_owner},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

/// False for values outside the declared enumerators.
inline constexpr bool is_known(const role_id_t value) {
  return to_string(value, kRoleIdMappings).has_value();
}

}  // namespace pharbit::schema
