#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/execution/outcome.hpp>
#include <pharbit/schema/register_stakeholder.hpp>
#include <pharbit/schema/set_kyc.hpp>
#include <pharbit/schema/set_stakeholder_active.hpp>
#include <vector>

namespace pharbit::execution {

/// Register an organisation and grant its stakeholder role. Records are
/// never deleted; deactivation is the only removal.
command_outcome register_stakeholder(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::register_stakeholder_t& command);

command_outcome set_kyc(ledger_state& state,
                        const command_context& context,
                        const pharbit::schema::set_kyc_t& command);

command_outcome set_stakeholder_active(
    ledger_state& state,
    const command_context& context,
    const pharbit::schema::set_stakeholder_active_t& command);

query_outcome<pharbit::schema::stakeholder_record_t> get_stakeholder(
    const ledger_state& state,
    const pharbit::schema::identity_t& identity);

/// All records in identity order.
std::vector<pharbit::schema::stakeholder_record_t> list_stakeholders(
    const ledger_state& state);

/// Registered, active and KYC-complete.
bool is_verified_stakeholder(const ledger_state& state,
                             const pharbit::schema::identity_t& identity);

}  // namespace pharbit::execution
