#include <gtest/gtest.h>
#include <pharbit/execution/compliance_engine.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <pharbit/testing/ledger_fixture.hpp>

#include <string>
#include <variant>
#include <vector>

namespace {

using pharbit::schema::compliance_status_t;
using pharbit::schema::error_code;
using encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;

class compliance_engine_test : public ::testing::Test {
 protected:
  void SetUp() override {
    fixture.onboard_supply_chain();
    fixture.create_batch("LOT-1");
  }

  pharbit::schema::record_id_t add_check(const pharbit::schema::identity_t& by,
                                         const std::string& check_type) {
    auto effect =
        fixture.ok(by, pharbit::schema::add_compliance_check_t{
                           .batch_id = "LOT-1",
                           .check_type = check_type,
                           .notes = "routine",
                           .evidence = {"ipfs://evidence-1"}});
    auto encoder = encoder_t{};
    return encoder.decode<pharbit::schema::record_id_t>(
        pharbit::schema::make_bytes_view(effect.data));
  }

  void review(pharbit::schema::record_id_t record_id,
              compliance_status_t status) {
    fixture.ok(fixture.who().inspector,
               pharbit::schema::update_compliance_status_t{
                   .record_id = record_id,
                   .status = status,
                   .passed = status == compliance_status_t::passed});
  }

  bool compliant() const {
    return pharbit::execution::is_batch_compliant(fixture.state(), "LOT-1");
  }

  pharbit::testing::ledger_fixture fixture;
};

}  // namespace

TEST_F(compliance_engine_test, new_checks_are_pending_with_sequential_ids) {
  const auto& who = fixture.who();
  EXPECT_EQ(add_check(who.inspector, "GMP"), 1u);
  EXPECT_EQ(add_check(who.auditor, "GDP"), 2u);

  auto record =
      pharbit::execution::get_compliance_record(fixture.state(), 2);
  ASSERT_TRUE(
      std::holds_alternative<pharbit::schema::compliance_record_t>(record));
  const auto& value = std::get<pharbit::schema::compliance_record_t>(record);
  EXPECT_EQ(value.status, compliance_status_t::pending);
  EXPECT_EQ(value.auditor, who.auditor);
  EXPECT_EQ(value.evidence.size(), 1u);
  auto records =
      pharbit::execution::compliance_records(fixture.state(), "LOT-1");
  ASSERT_TRUE(std::holds_alternative<
              std::vector<pharbit::schema::compliance_record_t>>(records));
  EXPECT_EQ(
      std::get<std::vector<pharbit::schema::compliance_record_t>>(records)
          .size(),
      2u);
  EXPECT_FALSE(compliant());
}

TEST_F(compliance_engine_test, compliance_needs_a_pass_and_no_failure) {
  const auto& who = fixture.who();
  auto first = add_check(who.inspector, "GMP");
  auto second = add_check(who.inspector, "GDP");
  review(first, compliance_status_t::passed);
  EXPECT_TRUE(compliant());

  review(second, compliance_status_t::failed);
  EXPECT_FALSE(compliant());

  review(second, compliance_status_t::requires_attention);
  EXPECT_TRUE(compliant());

  review(first, compliance_status_t::under_review);
  EXPECT_FALSE(compliant());
  EXPECT_FALSE(
      pharbit::execution::is_batch_compliant(fixture.state(), "UNKNOWN"));
}

TEST_F(compliance_engine_test, check_rejections) {
  const auto& who = fixture.who();
  EXPECT_EQ(fixture.fails(who.producer,
                          pharbit::schema::add_compliance_check_t{
                              .batch_id = "LOT-1", .check_type = "GMP"}),
            error_code::authorization_denied);
  EXPECT_EQ(fixture.fails(who.inspector,
                          pharbit::schema::add_compliance_check_t{
                              .batch_id = "NOPE", .check_type = "GMP"}),
            error_code::batch_missing);
  EXPECT_EQ(fixture.fails(who.inspector,
                          pharbit::schema::add_compliance_check_t{
                              .batch_id = "LOT-1"}),
            error_code::invalid_compliance_check);
  EXPECT_EQ(fixture.fails(who.regulator,
                          pharbit::schema::update_compliance_status_t{
                              .record_id = 42,
                              .status = compliance_status_t::passed}),
            error_code::compliance_record_missing);
  EXPECT_EQ(fixture.fails(who.producer,
                          pharbit::schema::update_compliance_status_t{
                              .record_id = 1,
                              .status = compliance_status_t::passed}),
            error_code::authorization_denied);
  EXPECT_TRUE(fixture.state().compliance_records.empty());
}

TEST_F(compliance_engine_test, unknown_status_values_are_rejected) {
  const auto& who = fixture.who();
  auto record_id = add_check(who.inspector, "GMP");
  EXPECT_EQ(fixture.fails(who.inspector,
                          pharbit::schema::update_compliance_status_t{
                              .record_id = record_id,
                              .status = static_cast<compliance_status_t>(42),
                              .passed = true}),
            error_code::invalid_compliance_check);
  const auto& stored = fixture.state().compliance_records.at(record_id);
  EXPECT_EQ(stored.status, compliance_status_t::pending);
  EXPECT_FALSE(stored.passed);
}

TEST_F(compliance_engine_test, audit_trail_appends_immutable_entries) {
  const auto& who = fixture.who();
  auto entry = pharbit::schema::record_audit_t{.batch_id = "LOT-1",
                                               .audit_type = "cold chain",
                                               .findings = "none",
                                               .result = "pass"};
  auto first = fixture.ok(who.auditor, entry);
  EXPECT_EQ(first.type, "audit_recorded");
  fixture.advance(500);
  entry.result = "pass with remarks";
  fixture.ok(who.auditor, entry);

  auto outcome = pharbit::execution::audit_trail(fixture.state(), "LOT-1");
  ASSERT_TRUE(
      std::holds_alternative<std::vector<pharbit::schema::audit_entry_t>>(
          outcome));
  const auto& trail =
      std::get<std::vector<pharbit::schema::audit_entry_t>>(outcome);
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].entry_id, 1u);
  EXPECT_EQ(trail[1].entry_id, 2u);
  EXPECT_EQ(trail[0].result, "pass");
  EXPECT_EQ(trail[1].created_at, trail[0].created_at + 500);

  EXPECT_EQ(fixture.fails(who.inspector, entry),
            error_code::authorization_denied);
  entry.audit_type.clear();
  EXPECT_EQ(fixture.fails(who.auditor, entry), error_code::invalid_audit_entry);
  auto unknown = pharbit::execution::audit_trail(fixture.state(), "LOT-404");
  ASSERT_TRUE(
      std::holds_alternative<pharbit::execution::command_error>(unknown));
  EXPECT_EQ(std::get<pharbit::execution::command_error>(unknown).code,
            error_code::batch_missing);
  auto no_records =
      pharbit::execution::compliance_records(fixture.state(), "LOT-404");
  ASSERT_TRUE(
      std::holds_alternative<pharbit::execution::command_error>(no_records));
  EXPECT_EQ(std::get<pharbit::execution::command_error>(no_records).code,
            error_code::batch_missing);
}
