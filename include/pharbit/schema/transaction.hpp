#pragma once
#include <pharbit/schema/add_compliance_check.hpp>
#include <pharbit/schema/add_owner.hpp>
#include <pharbit/schema/bind_sensor.hpp>
#include <pharbit/schema/cast_vote.hpp>
#include <pharbit/schema/create_batch.hpp>
#include <pharbit/schema/create_proposal.hpp>
#include <pharbit/schema/execute_proposal.hpp>
#include <pharbit/schema/grant_role.hpp>
#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/record_audit.hpp>
#include <pharbit/schema/record_telemetry.hpp>
#include <pharbit/schema/register_stakeholder.hpp>
#include <pharbit/schema/remove_owner.hpp>
#include <pharbit/schema/revoke_role.hpp>
#include <pharbit/schema/set_kyc.hpp>
#include <pharbit/schema/set_paused.hpp>
#include <pharbit/schema/set_quorum.hpp>
#include <pharbit/schema/set_stakeholder_active.hpp>
#include <pharbit/schema/set_telemetry_bounds.hpp>
#include <pharbit/schema/transfer_custody.hpp>
#include <pharbit/schema/update_batch_status.hpp>
#include <pharbit/schema/update_compliance_status.hpp>
#include <variant>

namespace pharbit::schema {

using transaction_payload_t = std::variant<grant_role_t,
                                           revoke_role_t,
                                           register_stakeholder_t,
                                           set_kyc_t,
                                           set_stakeholder_active_t,
                                           create_batch_t,
                                           update_batch_status_t,
                                           transfer_custody_t,
                                           set_telemetry_bounds_t,
                                           bind_sensor_t,
                                           record_telemetry_t,
                                           add_compliance_check_t,
                                           update_compliance_status_t,
                                           record_audit_t,
                                           add_owner_t,
                                           remove_owner_t,
                                           set_quorum_t,
                                           create_proposal_t,
                                           cast_vote_t,
                                           execute_proposal_t,
                                           set_paused_t>;

template <uint16_t Version>
struct transaction;

/// Command envelope. `caller` is resolved by the upstream identity provider
/// and `timestamp` is the logical "now" the command executes at.
template <>
struct transaction<1> final {
  uint16_t version{1};
  identity_t caller{};
  timestamp_milliseconds_t timestamp{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace pharbit::schema
