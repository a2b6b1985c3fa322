#include <gtest/gtest.h>
#include <pharbit/execution/batch_ledger.hpp>
#include <pharbit/testing/ledger_fixture.hpp>

#include <string>
#include <variant>
#include <vector>

namespace {

using pharbit::schema::batch_status_t;
using pharbit::schema::error_code;
using pharbit::schema::kMillisecondsPerDay;
using pharbit::schema::role_id_t;

const auto kAllStatuses = std::vector<batch_status_t>{
    batch_status_t::produced,   batch_status_t::in_transit,
    batch_status_t::at_distributor, batch_status_t::at_pharmacy,
    batch_status_t::dispensed,  batch_status_t::recalled,
    batch_status_t::expired,    batch_status_t::destroyed};

pharbit::schema::batch_state_t batch_of(
    const pharbit::testing::ledger_fixture& fixture,
    const std::string& batch_id) {
  auto batch = pharbit::execution::get_batch(fixture.state(), batch_id);
  EXPECT_TRUE(std::holds_alternative<pharbit::schema::batch_state_t>(batch));
  return std::get<pharbit::schema::batch_state_t>(batch);
}

class batch_ledger_test : public ::testing::Test {
 protected:
  void SetUp() override { fixture.onboard_supply_chain(); }

  pharbit::schema::transfer_custody_t transfer_to(
      const pharbit::schema::identity_t& custodian) const {
    return pharbit::schema::transfer_custody_t{.batch_id = "LOT-1",
                                               .new_custodian = custodian,
                                               .reason = "shipment",
                                               .location = "Warehouse 4"};
  }

  pharbit::testing::ledger_fixture fixture;
};

}  // namespace

TEST_F(batch_ledger_test, create_batch_starts_produced_with_producer) {
  const auto& who = fixture.who();
  auto effect = fixture.ok(who.producer, fixture.batch_command("LOT-1"));
  EXPECT_EQ(effect.type, "batch_created");
  EXPECT_EQ(effect.entity_id, "LOT-1");

  auto batch = batch_of(fixture, "LOT-1");
  EXPECT_EQ(batch.status, batch_status_t::produced);
  EXPECT_EQ(batch.producer, who.producer);
  EXPECT_EQ(batch.custodian, who.producer);
  EXPECT_EQ(batch.quantity, 1000u);
  EXPECT_EQ(batch.created_at, fixture.now());
}

TEST_F(batch_ledger_test, create_batch_validation) {
  const auto& who = fixture.who();
  EXPECT_EQ(fixture.fails(who.distributor, fixture.batch_command("LOT-1")),
            error_code::authorization_denied);

  auto mismatch = fixture.batch_command("LOT-1");
  mismatch.producer = who.retailer;
  EXPECT_EQ(fixture.fails(who.producer, mismatch),
            error_code::producer_mismatch);

  EXPECT_EQ(fixture.fails(who.producer, fixture.batch_command("")),
            error_code::invalid_batch);

  auto no_product = fixture.batch_command("LOT-1");
  no_product.product_name.clear();
  EXPECT_EQ(fixture.fails(who.producer, no_product),
            error_code::invalid_batch);

  auto empty = fixture.batch_command("LOT-1");
  empty.quantity = 0;
  EXPECT_EQ(fixture.fails(who.producer, empty), error_code::invalid_batch);

  auto backwards = fixture.batch_command("LOT-1");
  backwards.expiry_date = backwards.manufacture_date;
  EXPECT_EQ(fixture.fails(who.producer, backwards), error_code::invalid_batch);

  auto already_expired = fixture.batch_command("LOT-1");
  already_expired.manufacture_date = fixture.now() - 10 * kMillisecondsPerDay;
  already_expired.expiry_date = fixture.now() - kMillisecondsPerDay;
  EXPECT_EQ(fixture.fails(who.producer, already_expired),
            error_code::invalid_batch);

  auto bad_custodian = fixture.batch_command("LOT-1");
  bad_custodian.custodian = who.sensor;
  EXPECT_EQ(fixture.fails(who.producer, bad_custodian),
            error_code::invalid_custodian);

  EXPECT_TRUE(fixture.state().batches.empty());
}

TEST_F(batch_ledger_test, duplicate_batch_ids_are_rejected) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  auto duplicate = fixture.batch_command("LOT-1");
  duplicate.product_name = "Different";
  EXPECT_EQ(fixture.fails(who.producer, duplicate), error_code::batch_exists);
  EXPECT_EQ(batch_of(fixture, "LOT-1").product_name, "Amoxicillin 500mg");
}

TEST_F(batch_ledger_test, status_follows_the_supply_chain) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  for (auto status :
       {batch_status_t::in_transit, batch_status_t::at_distributor,
        batch_status_t::at_pharmacy, batch_status_t::dispensed}) {
    auto effect =
        fixture.ok(who.producer, pharbit::schema::update_batch_status_t{
                                     .batch_id = "LOT-1", .status = status});
    EXPECT_EQ(effect.type, "batch_status_updated");
    EXPECT_EQ(batch_of(fixture, "LOT-1").status, status);
  }
  EXPECT_EQ(fixture.fails(who.producer,
                          pharbit::schema::update_batch_status_t{
                              .batch_id = "LOT-1",
                              .status = batch_status_t::recalled}),
            error_code::invalid_status_transition);
}

TEST_F(batch_ledger_test, regulator_recalls_then_destroys) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  EXPECT_EQ(fixture.fails(who.regulator,
                          pharbit::schema::update_batch_status_t{
                              .batch_id = "LOT-1",
                              .status = batch_status_t::in_transit}),
            error_code::authorization_denied);
  fixture.ok(who.regulator, pharbit::schema::update_batch_status_t{
                                .batch_id = "LOT-1",
                                .status = batch_status_t::recalled,
                                .reason = "contamination"});
  fixture.ok(who.regulator, pharbit::schema::update_batch_status_t{
                                .batch_id = "LOT-1",
                                .status = batch_status_t::destroyed});
  auto batch = batch_of(fixture, "LOT-1");
  EXPECT_EQ(batch.status, batch_status_t::destroyed);
  EXPECT_EQ(batch.producer, who.producer);
}

TEST_F(batch_ledger_test, status_update_on_missing_batch) {
  EXPECT_EQ(fixture.fails(fixture.who().producer,
                          pharbit::schema::update_batch_status_t{
                              .batch_id = "NOPE",
                              .status = batch_status_t::in_transit}),
            error_code::batch_missing);
}

TEST_F(batch_ledger_test, unknown_status_values_are_rejected) {
  fixture.create_batch("LOT-1");
  EXPECT_EQ(fixture.fails(fixture.who().producer,
                          pharbit::schema::update_batch_status_t{
                              .batch_id = "LOT-1",
                              .status = static_cast<batch_status_t>(42)}),
            error_code::invalid_batch);
  EXPECT_EQ(batch_of(fixture, "LOT-1").status, batch_status_t::produced);
}

TEST_F(batch_ledger_test, every_status_pair_obeys_the_graph) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  for (auto from : kAllStatuses) {
    for (auto to : kAllStatuses) {
      fixture.mutable_state().batches.at("LOT-1").status = from;
      auto outcome = fixture.apply(
          who.producer, pharbit::schema::update_batch_status_t{
                            .batch_id = "LOT-1", .status = to});
      auto accepted =
          std::holds_alternative<pharbit::execution::state_transition>(
              outcome);
      EXPECT_EQ(accepted, pharbit::execution::is_transition_allowed(from, to))
          << pharbit::schema::to_string(from) << " -> "
          << pharbit::schema::to_string(to);
      EXPECT_EQ(batch_of(fixture, "LOT-1").status, accepted ? to : from);
    }
  }
}

TEST(batch_status_graph, terminal_statuses_have_no_forward_step) {
  EXPECT_FALSE(pharbit::execution::is_transition_allowed(
      batch_status_t::dispensed, batch_status_t::recalled));
  EXPECT_FALSE(pharbit::execution::is_transition_allowed(
      batch_status_t::destroyed, batch_status_t::produced));
  EXPECT_TRUE(pharbit::execution::is_transition_allowed(
      batch_status_t::expired, batch_status_t::destroyed));
  EXPECT_FALSE(pharbit::execution::is_transition_allowed(
      batch_status_t::produced, batch_status_t::at_distributor));
  EXPECT_TRUE(pharbit::execution::is_terminal(batch_status_t::recalled));
  EXPECT_FALSE(pharbit::execution::is_terminal(batch_status_t::at_pharmacy));
}

TEST_F(batch_ledger_test, custody_moves_to_verified_distributor) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  auto effect = fixture.ok(who.producer, transfer_to(who.distributor));
  EXPECT_EQ(effect.type, "custody_transferred");
  EXPECT_EQ(batch_of(fixture, "LOT-1").custodian, who.distributor);

  fixture.advance(1000);
  fixture.ok(who.distributor, transfer_to(who.retailer));

  auto transfers =
      pharbit::execution::custody_transfers(fixture.state(), "LOT-1");
  ASSERT_TRUE(
      std::holds_alternative<std::vector<pharbit::schema::custody_transfer_t>>(
          transfers));
  const auto& list =
      std::get<std::vector<pharbit::schema::custody_transfer_t>>(transfers);
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].previous_custodian, who.producer);
  EXPECT_EQ(list[0].new_custodian, who.distributor);
  EXPECT_EQ(list[1].previous_custodian, who.distributor);
  EXPECT_EQ(list[1].new_custodian, who.retailer);
  EXPECT_EQ(list[1].location, "Warehouse 4");
  EXPECT_LT(list[0].transferred_at, list[1].transferred_at);

  EXPECT_EQ(
      pharbit::execution::batches_by_custodian(fixture.state(), who.retailer)
          .size(),
      1u);
  EXPECT_TRUE(
      pharbit::execution::batches_by_custodian(fixture.state(), who.producer)
          .empty());
}

TEST_F(batch_ledger_test, only_the_custodian_transfers) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  EXPECT_EQ(fixture.fails(who.distributor, transfer_to(who.retailer)),
            error_code::not_custodian);
  EXPECT_EQ(fixture.fails(who.regulator, transfer_to(who.retailer)),
            error_code::not_custodian);
  EXPECT_EQ(batch_of(fixture, "LOT-1").custodian, who.producer);
}

TEST_F(batch_ledger_test, transfer_target_must_be_verified_custody_role) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  EXPECT_EQ(fixture.fails(who.producer, transfer_to(who.producer)),
            error_code::invalid_custodian);
  EXPECT_EQ(fixture.fails(who.producer, transfer_to(who.outsider)),
            error_code::invalid_custodian);
  EXPECT_EQ(fixture.fails(who.producer, transfer_to(who.inspector)),
            error_code::invalid_custodian);

  fixture.ok(who.registrar, pharbit::schema::set_kyc_t{
                                .subject = who.distributor,
                                .completed = false});
  EXPECT_EQ(fixture.fails(who.producer, transfer_to(who.distributor)),
            error_code::invalid_custodian);

  fixture.ok(who.registrar, pharbit::schema::set_kyc_t{
                                .subject = who.distributor,
                                .completed = true});
  fixture.ok(who.registrar, pharbit::schema::set_stakeholder_active_t{
                                .subject = who.distributor, .active = false});
  EXPECT_EQ(fixture.fails(who.producer, transfer_to(who.distributor)),
            error_code::invalid_custodian);

  fixture.ok(who.registrar, pharbit::schema::set_stakeholder_active_t{
                                .subject = who.distributor, .active = true});
  auto no_location = transfer_to(who.distributor);
  no_location.location.clear();
  EXPECT_EQ(fixture.fails(who.producer, no_location),
            error_code::invalid_custodian);
}

TEST_F(batch_ledger_test, terminal_or_expired_batches_do_not_move) {
  const auto& who = fixture.who();
  fixture.create_batch("LOT-1");
  fixture.ok(who.regulator, pharbit::schema::update_batch_status_t{
                                .batch_id = "LOT-1",
                                .status = batch_status_t::recalled});
  EXPECT_EQ(fixture.fails(who.producer, transfer_to(who.distributor)),
            error_code::invalid_status_transition);

  auto short_lived = fixture.batch_command("LOT-2", kMillisecondsPerDay);
  fixture.ok(who.producer, short_lived);
  fixture.advance(kMillisecondsPerDay);
  auto transfer = transfer_to(who.distributor);
  transfer.batch_id = "LOT-2";
  EXPECT_EQ(fixture.fails(who.producer, transfer), error_code::batch_expired);
}

TEST_F(batch_ledger_test, expiry_query) {
  fixture.create_batch("LOT-1");
  auto expiry = batch_of(fixture, "LOT-1").expiry_date;
  auto before =
      pharbit::execution::is_expired(fixture.state(), "LOT-1", expiry - 1);
  auto at = pharbit::execution::is_expired(fixture.state(), "LOT-1", expiry);
  ASSERT_TRUE(std::holds_alternative<bool>(before));
  ASSERT_TRUE(std::holds_alternative<bool>(at));
  EXPECT_FALSE(std::get<bool>(before));
  EXPECT_TRUE(std::get<bool>(at));

  auto missing =
      pharbit::execution::is_expired(fixture.state(), "NOPE", expiry);
  EXPECT_TRUE(std::holds_alternative<pharbit::execution::command_error>(
      missing));
}

TEST_F(batch_ledger_test, create_batch_with_downstream_custodian) {
  const auto& who = fixture.who();
  auto command = fixture.batch_command("LOT-1");
  command.custodian = who.distributor;
  fixture.ok(who.producer, command);
  EXPECT_EQ(batch_of(fixture, "LOT-1").custodian, who.distributor);
}
