#pragma once

#include <pharbit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: batch status.
// Supply chain workflow: physical one-way flow of a drug batch, with
// recall/expiry as the only cross-cutting exits.
namespace pharbit::schema {

enum class batch_status_t : uint8_t {
  produced = 0,
  in_transit = 1,
  at_distributor = 2,
  at_pharmacy = 3,
  dispensed = 4,
  recalled = 5,
  expired = 6,
  destroyed = 7
};

inline constexpr auto kBatchStatusMappings = std::array{
    std::pair<std::string_view, batch_status_t>{"produced",
                                                batch_status_t::produced},
    std::pair<std::string_view, batch_status_t>{"in_transit",
                                                batch_status_t::in_transit},
    std::pair<std::string_view, batch_status_t>{
        "at_distributor", batch_status_t::at_distributor},
    std::pair<std::string_view, batch_status_t>{"at_pharmacy",
                                                batch_status_t::at_pharmacy},
    std::pair<std::string_view, batch_status_t>{"dispensed",
                                                batch_status_t::dispensed},
    std::pair<std::string_view, batch_status_t>{"recalled",
                                                batch_status_t::recalled},
    std::pair<std::string_view, batch_status_t>{"expired",
                                                batch_status_t::expired},
    std::pair<std::string_view, batch_status_t>{"destroyed",
                                                batch_status_t::destroyed}};

template <>
inline std::optional<batch_status_t> try_from_string<batch_status_t>(
    const std::string_view value) {
  return from_string(value, kBatchStatusMappings);
}

inline constexpr std::string_view to_string(const batch_status_t value) {
  return to_string(value, kBatchStatusMappings).value_or("unknown");
}

inline constexpr bool is_known(const batch_status_t value) {
  return to_string(value, kBatchStatusMappings).has_value();
}

}  // namespace pharbit::schema
