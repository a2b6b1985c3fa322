#include <gtest/gtest.h>
#include <pharbit/execution/state_machine.hpp>
#include <pharbit/testing/ledger_fixture.hpp>

#include <string_view>
#include <variant>

namespace {

using pharbit::schema::error_code;
using pharbit::schema::role_id_t;

}  // namespace

TEST(state_machine, failures_leave_input_state_untouched) {
  auto fixture = pharbit::testing::ledger_fixture{};
  fixture.onboard_supply_chain();
  const auto& who = fixture.who();
  const auto before = fixture.state();

  auto tx = pharbit::schema::transaction_t{
      .caller = who.producer,
      .timestamp = fixture.now(),
      .payload = fixture.batch_command("")};
  auto outcome = pharbit::execution::apply_transaction(before, tx);
  ASSERT_TRUE(
      std::holds_alternative<pharbit::execution::command_error>(outcome));
  EXPECT_TRUE(before.batches.empty());
  EXPECT_EQ(before.stakeholders.size(), fixture.state().stakeholders.size());
}

TEST(state_machine, success_returns_new_state_without_mutating_input) {
  auto fixture = pharbit::testing::ledger_fixture{};
  fixture.onboard_supply_chain();
  const auto& who = fixture.who();
  const auto before = fixture.state();

  auto tx = pharbit::schema::transaction_t{
      .caller = who.producer,
      .timestamp = fixture.now(),
      .payload = fixture.batch_command("LOT-1")};
  auto outcome = pharbit::execution::apply_transaction(before, tx);
  ASSERT_TRUE(
      std::holds_alternative<pharbit::execution::state_transition>(outcome));
  const auto& transition =
      std::get<pharbit::execution::state_transition>(outcome);
  EXPECT_TRUE(before.batches.empty());
  EXPECT_TRUE(transition.state.batches.contains("LOT-1"));
  EXPECT_EQ(transition.effect.type, "batch_created");
}

TEST(state_machine, unsupported_version_is_rejected) {
  auto fixture = pharbit::testing::ledger_fixture{};
  auto tx = pharbit::schema::transaction_t{};
  tx.version = 2;
  tx.caller = fixture.who().admin;
  auto outcome = pharbit::execution::apply_transaction(fixture.state(), tx);
  ASSERT_TRUE(
      std::holds_alternative<pharbit::execution::command_error>(outcome));
  EXPECT_EQ(std::get<pharbit::execution::command_error>(outcome).code,
            error_code::unsupported_transaction_version);
}

TEST(state_machine, pause_blocks_everything_but_resume) {
  auto fixture = pharbit::testing::ledger_fixture{};
  fixture.onboard_supply_chain();
  const auto& who = fixture.who();

  EXPECT_EQ(fixture.fails(who.producer,
                          pharbit::schema::set_paused_t{.paused = true}),
            error_code::authorization_denied);
  auto paused =
      fixture.ok(who.admin, pharbit::schema::set_paused_t{.paused = true});
  EXPECT_EQ(paused.type, "ledger_paused");

  EXPECT_EQ(fixture.fails(who.producer, fixture.batch_command("LOT-1")),
            error_code::engine_paused);
  EXPECT_EQ(fixture.fails(who.admin,
                          pharbit::schema::grant_role_t{
                              .subject = who.outsider,
                              .role = role_id_t::auditor}),
            error_code::engine_paused);

  auto resumed =
      fixture.ok(who.admin, pharbit::schema::set_paused_t{.paused = false});
  EXPECT_EQ(resumed.type, "ledger_resumed");
  fixture.create_batch("LOT-1");
}

TEST(state_machine, command_names_and_codespaces) {
  auto batch = pharbit::schema::transaction_payload_t{
      pharbit::schema::create_batch_t{}};
  EXPECT_EQ(pharbit::execution::command_name(batch), "create_batch");
  EXPECT_EQ(pharbit::execution::codespace_of(batch), "pharbit.batches");

  auto vote =
      pharbit::schema::transaction_payload_t{pharbit::schema::cast_vote_t{}};
  EXPECT_EQ(pharbit::execution::command_name(vote), "cast_vote");
  EXPECT_EQ(pharbit::execution::codespace_of(vote), "pharbit.governance");

  auto reading = pharbit::schema::transaction_payload_t{
      pharbit::schema::record_telemetry_t{}};
  EXPECT_EQ(pharbit::execution::codespace_of(reading), "pharbit.telemetry");

  auto pause =
      pharbit::schema::transaction_payload_t{pharbit::schema::set_paused_t{}};
  EXPECT_EQ(pharbit::execution::codespace_of(pause), "pharbit.ledger");
}

TEST(state_machine, every_command_family_has_its_codespace) {
  using namespace pharbit::schema;
  auto expect = [](const transaction_payload_t& payload,
                   std::string_view codespace) {
    EXPECT_EQ(pharbit::execution::codespace_of(payload), codespace)
        << pharbit::execution::command_name(payload);
  };
  expect(grant_role_t{}, "pharbit.access");
  expect(revoke_role_t{}, "pharbit.access");
  expect(register_stakeholder_t{}, "pharbit.stakeholders");
  expect(set_kyc_t{}, "pharbit.stakeholders");
  expect(set_stakeholder_active_t{}, "pharbit.stakeholders");
  expect(create_batch_t{}, "pharbit.batches");
  expect(update_batch_status_t{}, "pharbit.batches");
  expect(transfer_custody_t{}, "pharbit.batches");
  expect(set_telemetry_bounds_t{}, "pharbit.telemetry");
  expect(bind_sensor_t{}, "pharbit.telemetry");
  expect(record_telemetry_t{}, "pharbit.telemetry");
  expect(add_compliance_check_t{}, "pharbit.compliance");
  expect(update_compliance_status_t{}, "pharbit.compliance");
  expect(record_audit_t{}, "pharbit.compliance");
  expect(add_owner_t{}, "pharbit.governance");
  expect(remove_owner_t{}, "pharbit.governance");
  expect(set_quorum_t{}, "pharbit.governance");
  expect(create_proposal_t{}, "pharbit.governance");
  expect(cast_vote_t{}, "pharbit.governance");
  expect(execute_proposal_t{}, "pharbit.governance");
  expect(set_paused_t{}, "pharbit.ledger");
}

TEST(state_machine, genesis_validation) {
  auto who = pharbit::testing::actors{};
  auto genesis = pharbit::testing::make_test_genesis(who);
  EXPECT_FALSE(pharbit::execution::validate_genesis(genesis).has_value());

  auto too_high = genesis;
  too_high.quorum = 4;
  EXPECT_EQ(pharbit::execution::validate_genesis(too_high)->code,
            error_code::invalid_quorum);

  auto duplicate = genesis;
  duplicate.owners.push_back(who.owner_a);
  EXPECT_EQ(pharbit::execution::validate_genesis(duplicate)->code,
            error_code::invalid_owner);

  auto no_owners = pharbit::schema::genesis_t{};
  EXPECT_FALSE(pharbit::execution::validate_genesis(no_owners).has_value());
  no_owners.quorum = 1;
  EXPECT_EQ(pharbit::execution::validate_genesis(no_owners)->code,
            error_code::invalid_quorum);
}
