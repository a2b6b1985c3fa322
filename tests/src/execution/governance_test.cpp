#include <gtest/gtest.h>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/governance.hpp>
#include <pharbit/execution/telemetry_validator.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <pharbit/testing/ledger_fixture.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using pharbit::schema::error_code;
using pharbit::schema::kMillisecondsPerMinute;
using pharbit::schema::role_id_t;
using encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;

constexpr pharbit::schema::duration_milliseconds_t kOneHour =
    60 * kMillisecondsPerMinute;

class governance_test : public ::testing::Test {
 protected:
  pharbit::schema::proposal_id_t propose(
      const std::string& description,
      std::optional<pharbit::schema::governance_action_t> action =
          std::nullopt) {
    auto effect = fixture.ok(fixture.who().owner_a,
                             pharbit::schema::create_proposal_t{
                                 .description = description,
                                 .voting_period = kOneHour,
                                 .action = std::move(action)});
    auto encoder = encoder_t{};
    return encoder.decode<pharbit::schema::proposal_id_t>(
        pharbit::schema::make_bytes_view(effect.data));
  }

  void vote(const pharbit::schema::identity_t& owner,
            pharbit::schema::proposal_id_t proposal_id,
            bool support) {
    fixture.ok(owner, pharbit::schema::cast_vote_t{.proposal_id = proposal_id,
                                                   .support = support});
  }

  bool execute(pharbit::schema::proposal_id_t proposal_id) {
    auto effect =
        fixture.ok(fixture.who().owner_c, pharbit::schema::execute_proposal_t{
                                              .proposal_id = proposal_id});
    auto encoder = encoder_t{};
    return encoder.decode<bool>(pharbit::schema::make_bytes_view(effect.data));
  }

  pharbit::testing::ledger_fixture fixture;
};

}  // namespace

TEST_F(governance_test, quorum_of_two_owners_passes_once) {
  const auto& who = fixture.who();
  auto proposal_id = propose("raise limits");
  EXPECT_EQ(proposal_id, 1u);
  vote(who.owner_a, proposal_id, true);
  vote(who.owner_b, proposal_id, true);

  EXPECT_EQ(fixture.fails(who.owner_a, pharbit::schema::execute_proposal_t{
                                           .proposal_id = proposal_id}),
            error_code::voting_still_open);

  fixture.advance(kOneHour);
  EXPECT_TRUE(execute(proposal_id));

  auto code = fixture.fails(who.owner_a, pharbit::schema::execute_proposal_t{
                                             .proposal_id = proposal_id});
  EXPECT_EQ(code, error_code::proposal_already_executed);
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(pharbit::schema::kind_of(*code),
            pharbit::schema::error_kind::voting_closed);
}

TEST_F(governance_test, one_vote_short_of_quorum_fails) {
  const auto& who = fixture.who();
  auto proposal_id = propose("lower limits");
  vote(who.owner_a, proposal_id, true);
  fixture.advance(kOneHour);
  EXPECT_FALSE(execute(proposal_id));

  auto proposal =
      pharbit::execution::get_proposal(fixture.state(), proposal_id);
  ASSERT_TRUE(
      std::holds_alternative<pharbit::schema::proposal_state_t>(proposal));
  const auto& value = std::get<pharbit::schema::proposal_state_t>(proposal);
  EXPECT_TRUE(value.executed);
  EXPECT_FALSE(value.passed);
}

TEST(governance, majority_against_blocks_passing) {
  auto fixture_of_one = pharbit::testing::ledger_fixture{1};
  const auto& who = fixture_of_one.who();
  auto effect = fixture_of_one.ok(
      who.owner_a, pharbit::schema::create_proposal_t{
                       .description = "split vote", .voting_period = kOneHour});
  auto proposal_id = encoder_t{}.decode<pharbit::schema::proposal_id_t>(
      pharbit::schema::make_bytes_view(effect.data));
  fixture_of_one.ok(who.owner_a, pharbit::schema::cast_vote_t{
                                     .proposal_id = proposal_id,
                                     .support = true});
  fixture_of_one.ok(who.owner_b, pharbit::schema::cast_vote_t{
                                     .proposal_id = proposal_id,
                                     .support = false});
  fixture_of_one.advance(kOneHour);
  auto executed = fixture_of_one.ok(
      who.owner_a,
      pharbit::schema::execute_proposal_t{.proposal_id = proposal_id});
  EXPECT_FALSE(encoder_t{}.decode<bool>(
      pharbit::schema::make_bytes_view(executed.data)));
}

TEST_F(governance_test, voting_rules) {
  const auto& who = fixture.who();
  auto proposal_id = propose("rotate keys");
  vote(who.owner_a, proposal_id, true);
  EXPECT_EQ(fixture.fails(who.owner_a, pharbit::schema::cast_vote_t{
                                           .proposal_id = proposal_id,
                                           .support = false}),
            error_code::already_voted);
  EXPECT_EQ(fixture.fails(who.admin, pharbit::schema::cast_vote_t{
                                         .proposal_id = proposal_id,
                                         .support = true}),
            error_code::not_owner);
  EXPECT_EQ(fixture.fails(who.owner_b, pharbit::schema::cast_vote_t{
                                           .proposal_id = 99,
                                           .support = true}),
            error_code::proposal_not_found);

  fixture.advance(kOneHour);
  EXPECT_EQ(fixture.fails(who.owner_b, pharbit::schema::cast_vote_t{
                                           .proposal_id = proposal_id,
                                           .support = true}),
            error_code::voting_closed);
}

TEST_F(governance_test, proposal_validation) {
  const auto& who = fixture.who();
  EXPECT_EQ(fixture.fails(who.outsider, pharbit::schema::create_proposal_t{
                                            .description = "x",
                                            .voting_period = kOneHour}),
            error_code::not_owner);
  EXPECT_EQ(fixture.fails(who.owner_a, pharbit::schema::create_proposal_t{
                                           .description = "",
                                           .voting_period = kOneHour}),
            error_code::invalid_proposal);
  EXPECT_EQ(fixture.fails(who.owner_a,
                          pharbit::schema::create_proposal_t{
                              .description = "too fast",
                              .voting_period = kMillisecondsPerMinute - 1}),
            error_code::invalid_proposal);
  EXPECT_EQ(fixture.fails(who.owner_a,
                          pharbit::schema::create_proposal_t{
                              .description = "too slow",
                              .voting_period =
                                  pharbit::schema::kMaxVotingPeriod + 1}),
            error_code::invalid_proposal);
  EXPECT_EQ(fixture.fails(who.owner_a,
                          pharbit::schema::create_proposal_t{
                              .description = "crown an owner",
                              .voting_period = kOneHour,
                              .action = pharbit::schema::grant_role_t{
                                  .subject = who.outsider,
                                  .role = role_id_t::governance_owner}}),
            error_code::invalid_governance_action);
  EXPECT_TRUE(fixture.state().proposals.empty());
}

TEST_F(governance_test, passed_proposal_applies_its_action) {
  const auto& who = fixture.who();
  auto proposal_id = propose(
      "appoint inspector", pharbit::schema::grant_role_t{
                               .subject = who.outsider,
                               .role = role_id_t::inspector});
  vote(who.owner_a, proposal_id, true);
  vote(who.owner_b, proposal_id, true);
  EXPECT_FALSE(pharbit::execution::has_role(fixture.state(), who.outsider,
                                            role_id_t::inspector));
  fixture.advance(kOneHour);

  auto effect = fixture.ok(who.owner_c, pharbit::schema::execute_proposal_t{
                                            .proposal_id = proposal_id});
  EXPECT_EQ(effect.type, "proposal_executed");
  EXPECT_TRUE(pharbit::execution::has_role(fixture.state(), who.outsider,
                                           role_id_t::inspector));
  auto has_action = false;
  for (const auto& attribute : effect.attributes) {
    has_action = has_action || (attribute.key == "action" &&
                                attribute.value == "role_granted");
  }
  EXPECT_TRUE(has_action);
}

TEST_F(governance_test, invalid_actions_are_rejected_at_proposal) {
  const auto& who = fixture.who();
  auto bounds = pharbit::schema::telemetry_bounds_t{};
  bounds.min_temperature = -50;
  EXPECT_EQ(fixture.fails(who.owner_a,
                          pharbit::schema::create_proposal_t{
                              .description = "tighten LOT-9",
                              .voting_period = kOneHour,
                              .action = pharbit::schema::set_telemetry_bounds_t{
                                  .batch_id = "LOT-9", .bounds = bounds}}),
            error_code::invalid_governance_action);
  EXPECT_EQ(fixture.fails(who.owner_a,
                          pharbit::schema::create_proposal_t{
                              .description = "grant nothing",
                              .voting_period = kOneHour,
                              .action = pharbit::schema::grant_role_t{
                                  .subject = who.outsider,
                                  .role = static_cast<role_id_t>(42)}}),
            error_code::invalid_governance_action);
  EXPECT_EQ(fixture.fails(who.owner_a,
                          pharbit::schema::create_proposal_t{
                              .description = "revoke nothing",
                              .voting_period = kOneHour,
                              .action = pharbit::schema::revoke_role_t{
                                  .subject = who.outsider,
                                  .role = static_cast<role_id_t>(42)}}),
            error_code::invalid_governance_action);
  EXPECT_TRUE(fixture.state().proposals.empty());
  EXPECT_EQ(fixture.state().governance.next_proposal_id, 1u);

  fixture.onboard_supply_chain();
  fixture.create_batch("LOT-9");
  auto proposal_id = propose(
      "tighten LOT-9", pharbit::schema::set_telemetry_bounds_t{
                           .batch_id = "LOT-9", .bounds = bounds});
  vote(who.owner_a, proposal_id, true);
  vote(who.owner_b, proposal_id, true);
  fixture.advance(kOneHour);
  EXPECT_TRUE(execute(proposal_id));
  EXPECT_EQ(fixture.state().batch_bounds.at("LOT-9").min_temperature, -50);
}

TEST_F(governance_test, owner_management) {
  const auto& who = fixture.who();
  EXPECT_EQ(fixture.fails(who.owner_a, pharbit::schema::add_owner_t{
                                           .owner = who.outsider}),
            error_code::authorization_denied);
  EXPECT_EQ(fixture.fails(who.admin,
                          pharbit::schema::add_owner_t{.owner = who.owner_a}),
            error_code::owner_exists);
  EXPECT_EQ(fixture.fails(who.admin,
                          pharbit::schema::add_owner_t{
                              .owner = pharbit::schema::make_zero_hash()}),
            error_code::invalid_owner);

  fixture.ok(who.admin, pharbit::schema::add_owner_t{.owner = who.outsider});
  EXPECT_EQ(pharbit::execution::owners(fixture.state()).size(), 4u);
  EXPECT_TRUE(pharbit::execution::has_role(fixture.state(), who.outsider,
                                           role_id_t::governance_owner));

  fixture.ok(who.admin, pharbit::schema::set_quorum_t{.quorum = 4});
  EXPECT_EQ(
      fixture.fails(who.admin, pharbit::schema::set_quorum_t{.quorum = 5}),
      error_code::invalid_quorum);
  EXPECT_EQ(
      fixture.fails(who.admin, pharbit::schema::set_quorum_t{.quorum = 0}),
      error_code::invalid_quorum);

  fixture.ok(who.admin, pharbit::schema::remove_owner_t{.owner = who.owner_c});
  EXPECT_EQ(pharbit::execution::quorum(fixture.state()), 3u);
  EXPECT_FALSE(pharbit::execution::has_role(fixture.state(), who.owner_c,
                                            role_id_t::governance_owner));
  EXPECT_EQ(fixture.fails(who.admin, pharbit::schema::remove_owner_t{
                                         .owner = who.owner_c}),
            error_code::invalid_owner);
}

TEST_F(governance_test, removing_every_owner_clamps_quorum_to_zero) {
  const auto& who = fixture.who();
  for (const auto& owner : {who.owner_a, who.owner_b, who.owner_c}) {
    fixture.ok(who.admin, pharbit::schema::remove_owner_t{.owner = owner});
  }
  EXPECT_TRUE(pharbit::execution::owners(fixture.state()).empty());
  EXPECT_EQ(pharbit::execution::quorum(fixture.state()), 0u);

  fixture.ok(who.admin, pharbit::schema::add_owner_t{.owner = who.owner_a});
  EXPECT_EQ(pharbit::execution::quorum(fixture.state()), 1u);
}

TEST_F(governance_test, staleness_window_action) {
  const auto& who = fixture.who();
  auto proposal_id = propose(
      "shorter window", pharbit::schema::set_staleness_window_t{
                            .window = 10 * kMillisecondsPerMinute});
  vote(who.owner_a, proposal_id, true);
  vote(who.owner_b, proposal_id, true);
  fixture.advance(kOneHour);
  EXPECT_TRUE(execute(proposal_id));
  EXPECT_EQ(fixture.state().parameters.telemetry_staleness_window,
            10 * kMillisecondsPerMinute);
}
