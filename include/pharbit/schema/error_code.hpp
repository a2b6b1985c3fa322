#pragma once

#include <pharbit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace pharbit::schema {

/// Stable numeric failure codes returned in `transaction_result_t::code`.
enum class error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  clock_regression = 3,
  engine_paused = 4,
  authorization_denied = 10,
  protected_role = 11,
  invalid_role = 12,
  stakeholder_already_registered = 20,
  stakeholder_not_registered = 21,
  invalid_stakeholder = 22,
  batch_exists = 30,
  batch_missing = 31,
  invalid_batch = 32,
  invalid_status_transition = 33,
  not_custodian = 34,
  invalid_custodian = 35,
  batch_expired = 36,
  producer_mismatch = 37,
  invalid_telemetry_bounds = 40,
  invalid_telemetry = 41,
  stale_telemetry = 42,
  telemetry_missing = 43,
  telemetry_index_out_of_bounds = 44,
  sensor_not_bound = 45,
  invalid_sensor = 46,
  invalid_compliance_check = 50,
  compliance_record_missing = 51,
  invalid_audit_entry = 52,
  not_owner = 60,
  invalid_owner = 61,
  invalid_quorum = 62,
  invalid_proposal = 63,
  proposal_not_found = 64,
  voting_closed = 65,
  voting_still_open = 66,
  already_voted = 67,
  proposal_already_executed = 68,
  invalid_governance_action = 69,
  owner_exists = 70,
};

/// Caller-facing failure taxonomy; several codes share one kind.
enum class error_kind : uint8_t {
  unauthorized = 0,
  not_found = 1,
  bad_input = 2,
  invalid_transition = 3,
  already_exists = 4,
  already_registered = 5,
  already_voted = 6,
  stale_data = 7,
  voting_closed = 8,
  proposal_not_found = 9,
  not_custodian = 10,
  not_registered = 11,
  out_of_bounds = 12,
  invalid_owner = 13,
  invalid_quorum = 14,
  paused = 15
};

inline constexpr auto kErrorKindMappings = std::array{
    std::pair<std::string_view, error_kind>{"unauthorized",
                                            error_kind::unauthorized},
    std::pair<std::string_view, error_kind>{"not_found", error_kind::not_found},
    std::pair<std::string_view, error_kind>{"bad_input", error_kind::bad_input},
    std::pair<std::string_view, error_kind>{"invalid_transition",
                                            error_kind::invalid_transition},
    std::pair<std::string_view, error_kind>{"already_exists",
                                            error_kind::already_exists},
    std::pair<std::string_view, error_kind>{"already_registered",
                                            error_kind::already_registered},
    std::pair<std::string_view, error_kind>{"already_voted",
                                            error_kind::already_voted},
    std::pair<std::string_view, error_kind>{"stale_data",
                                            error_kind::stale_data},
    std::pair<std::string_view, error_kind>{"voting_closed",
                                            error_kind::voting_closed},
    std::pair<std::string_view, error_kind>{"proposal_not_found",
                                            error_kind::proposal_not_found},
    std::pair<std::string_view, error_kind>{"not_custodian",
                                            error_kind::not_custodian},
    std::pair<std::string_view, error_kind>{"not_registered",
                                            error_kind::not_registered},
    std::pair<std::string_view, error_kind>{"out_of_bounds",
                                            error_kind::out_of_bounds},
    std::pair<std::string_view, error_kind>{"invalid_owner",
                                            error_kind::invalid_owner},
    std::pair<std::string_view, error_kind>{"invalid_quorum",
                                            error_kind::invalid_quorum},
    std::pair<std::string_view, error_kind>{"paused", error_kind::paused}};

inline constexpr std::string_view to_string(const error_kind value) {
  return to_string(value, kErrorKindMappings).value_or("unknown");
}

constexpr error_kind kind_of(const error_code code) {
  switch (code) {
    case error_code::authorization_denied:
    case error_code::producer_mismatch:
    case error_code::sensor_not_bound:
    case error_code::not_owner:
      return error_kind::unauthorized;
    case error_code::batch_missing:
    case error_code::telemetry_missing:
    case error_code::compliance_record_missing:
      return error_kind::not_found;
    case error_code::invalid_status_transition:
    case error_code::batch_expired:
      return error_kind::invalid_transition;
    case error_code::owner_exists:
      return error_kind::already_exists;
    case error_code::stakeholder_already_registered:
      return error_kind::already_registered;
    case error_code::stakeholder_not_registered:
      return error_kind::not_registered;
    case error_code::already_voted:
      return error_kind::already_voted;
    case error_code::clock_regression:
    case error_code::stale_telemetry:
      return error_kind::stale_data;
    case error_code::voting_closed:
    case error_code::voting_still_open:
    case error_code::proposal_already_executed:
      return error_kind::voting_closed;
    case error_code::proposal_not_found:
      return error_kind::proposal_not_found;
    case error_code::not_custodian:
      return error_kind::not_custodian;
    case error_code::telemetry_index_out_of_bounds:
      return error_kind::out_of_bounds;
    case error_code::invalid_owner:
      return error_kind::invalid_owner;
    case error_code::invalid_quorum:
      return error_kind::invalid_quorum;
    case error_code::engine_paused:
      return error_kind::paused;
    default:
      return error_kind::bad_input;
  }
}

}  // namespace pharbit::schema
