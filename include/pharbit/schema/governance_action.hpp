#pragma once

#include <pharbit/schema/grant_role.hpp>
#include <pharbit/schema/revoke_role.hpp>
#include <pharbit/schema/set_staleness_window.hpp>
#include <pharbit/schema/set_telemetry_bounds.hpp>
#include <variant>

// Schema type: governance action.
// Supply chain workflow: administrative change carried by a proposal and
// applied when the proposal executes as passed.
namespace pharbit::schema {

using governance_action_t = std::variant<set_telemetry_bounds_t,
                                         grant_role_t,
                                         revoke_role_t,
                                         set_staleness_window_t>;

}  // namespace pharbit::schema
