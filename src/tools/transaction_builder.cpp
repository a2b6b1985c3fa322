#include <boost/program_options.hpp>
#include <pharbit/blake3/hash.hpp>
#include <pharbit/common/critical.hpp>
#include <pharbit/schema/batch_status.hpp>
#include <pharbit/schema/compliance_status.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <pharbit/schema/role_id.hpp>
#include <pharbit/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

pharbit::schema::identity_t get_identity(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    pharbit::common::critical("missing required identity argument --" + name);
  }
  auto identity =
      pharbit::schema::try_make_hash32(vm[name].as<std::string>());
  if (!identity) {
    pharbit::common::critical("--" + name + " must be a 32-byte hex identity");
  }
  return *identity;
}

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    pharbit::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

std::vector<std::string> get_strings(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

template <typename Enum>
Enum get_enum(const po::variables_map& vm, const std::string& name) {
  auto value =
      pharbit::schema::try_from_string<Enum>(get_string(vm, name));
  if (!value) {
    pharbit::common::critical("unknown value for --" + name);
  }
  return *value;
}

pharbit::schema::telemetry_bounds_t build_bounds(const po::variables_map& vm) {
  auto bounds = pharbit::schema::telemetry_bounds_t{};
  bounds.min_temperature = vm["min-temperature"].as<int32_t>();
  bounds.max_temperature = vm["max-temperature"].as<int32_t>();
  bounds.max_humidity = vm["max-humidity"].as<uint32_t>();
  return bounds;
}

std::optional<pharbit::schema::batch_id_t> get_optional_batch_id(
    const po::variables_map& vm) {
  if (!vm.contains("batch-id")) {
    return std::nullopt;
  }
  return vm["batch-id"].as<std::string>();
}

std::optional<pharbit::schema::governance_action_t> build_action(
    const po::variables_map& vm) {
  auto action = vm["action"].as<std::string>();
  if (action == "none") {
    return std::nullopt;
  }
  if (action == "set_telemetry_bounds") {
    return pharbit::schema::set_telemetry_bounds_t{
        .batch_id = get_optional_batch_id(vm), .bounds = build_bounds(vm)};
  }
  if (action == "grant_role") {
    return pharbit::schema::grant_role_t{
        .subject = get_identity(vm, "subject"),
        .role = get_enum<pharbit::schema::role_id_t>(vm, "role")};
  }
  if (action == "revoke_role") {
    return pharbit::schema::revoke_role_t{
        .subject = get_identity(vm, "subject"),
        .role = get_enum<pharbit::schema::role_id_t>(vm, "role")};
  }
  if (action == "set_staleness_window") {
    return pharbit::schema::set_staleness_window_t{
        .window = vm["window"].as<uint64_t>()};
  }
  pharbit::common::critical(
      "action must be none|set_telemetry_bounds|grant_role|revoke_role|"
      "set_staleness_window");
}

pharbit::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "grant_role") {
    return pharbit::schema::grant_role_t{
        .subject = get_identity(vm, "subject"),
        .role = get_enum<pharbit::schema::role_id_t>(vm, "role")};
  }
  if (payload == "revoke_role") {
    return pharbit::schema::revoke_role_t{
        .subject = get_identity(vm, "subject"),
        .role = get_enum<pharbit::schema::role_id_t>(vm, "role")};
  }
  if (payload == "register_stakeholder") {
    return pharbit::schema::register_stakeholder_t{
        .subject = get_identity(vm, "subject"),
        .name = get_string(vm, "name"),
        .role = get_enum<pharbit::schema::role_id_t>(vm, "role")};
  }
  if (payload == "set_kyc") {
    return pharbit::schema::set_kyc_t{
        .subject = get_identity(vm, "subject"),
        .completed = vm["completed"].as<bool>(),
        .reference = vm["reference"].as<std::string>()};
  }
  if (payload == "set_stakeholder_active") {
    return pharbit::schema::set_stakeholder_active_t{
        .subject = get_identity(vm, "subject"),
        .active = vm["active"].as<bool>()};
  }
  if (payload == "create_batch") {
    auto producer = vm.contains("producer") ? get_identity(vm, "producer")
                                            : get_identity(vm, "caller");
    auto custodian =
        vm.contains("custodian") ? get_identity(vm, "custodian") : producer;
    return pharbit::schema::create_batch_t{
        .batch_id = get_string(vm, "batch-id"),
        .product_name = get_string(vm, "product-name"),
        .producer = producer,
        .quantity = vm["quantity"].as<uint64_t>(),
        .manufacture_date = vm["manufacture-date"].as<uint64_t>(),
        .expiry_date = vm["expiry-date"].as<uint64_t>(),
        .custodian = custodian};
  }
  if (payload == "update_batch_status") {
    return pharbit::schema::update_batch_status_t{
        .batch_id = get_string(vm, "batch-id"),
        .status = get_enum<pharbit::schema::batch_status_t>(vm, "status"),
        .reason = vm["reason"].as<std::string>()};
  }
  if (payload == "transfer_custody") {
    return pharbit::schema::transfer_custody_t{
        .batch_id = get_string(vm, "batch-id"),
        .new_custodian = get_identity(vm, "new-custodian"),
        .reason = vm["reason"].as<std::string>(),
        .location = get_string(vm, "location")};
  }
  if (payload == "set_telemetry_bounds") {
    return pharbit::schema::set_telemetry_bounds_t{
        .batch_id = get_optional_batch_id(vm), .bounds = build_bounds(vm)};
  }
  if (payload == "bind_sensor") {
    return pharbit::schema::bind_sensor_t{
        .batch_id = get_string(vm, "batch-id"),
        .device = get_identity(vm, "device")};
  }
  if (payload == "record_telemetry") {
    return pharbit::schema::record_telemetry_t{
        .batch_id = get_string(vm, "batch-id"),
        .temperature = vm["temperature"].as<int32_t>(),
        .humidity = vm["humidity"].as<uint32_t>(),
        .location = get_string(vm, "location"),
        .recorded_at = vm["recorded-at"].as<uint64_t>()};
  }
  if (payload == "add_compliance_check") {
    return pharbit::schema::add_compliance_check_t{
        .batch_id = get_string(vm, "batch-id"),
        .check_type = get_string(vm, "check-type"),
        .notes = vm["notes"].as<std::string>(),
        .findings = vm["findings"].as<std::string>(),
        .corrective_actions = vm["corrective-actions"].as<std::string>(),
        .evidence = get_strings(vm, "evidence")};
  }
  if (payload == "update_compliance_status") {
    return pharbit::schema::update_compliance_status_t{
        .record_id = vm["record-id"].as<uint64_t>(),
        .status = get_enum<pharbit::schema::compliance_status_t>(
            vm, "compliance-status"),
        .passed = vm["passed"].as<bool>(),
        .notes = vm["notes"].as<std::string>()};
  }
  if (payload == "record_audit") {
    return pharbit::schema::record_audit_t{
        .batch_id = get_string(vm, "batch-id"),
        .audit_type = get_string(vm, "audit-type"),
        .findings = vm["findings"].as<std::string>(),
        .recommendations = vm["recommendations"].as<std::string>(),
        .result = vm["result"].as<std::string>(),
        .evidence = get_strings(vm, "evidence")};
  }
  if (payload == "add_owner") {
    return pharbit::schema::add_owner_t{.owner = get_identity(vm, "owner")};
  }
  if (payload == "remove_owner") {
    return pharbit::schema::remove_owner_t{.owner = get_identity(vm, "owner")};
  }
  if (payload == "set_quorum") {
    return pharbit::schema::set_quorum_t{.quorum = vm["quorum"].as<uint32_t>()};
  }
  if (payload == "create_proposal") {
    return pharbit::schema::create_proposal_t{
        .description = get_string(vm, "description"),
        .voting_period = vm["voting-period"].as<uint64_t>(),
        .action = build_action(vm)};
  }
  if (payload == "cast_vote") {
    return pharbit::schema::cast_vote_t{
        .proposal_id = vm["proposal-id"].as<uint64_t>(),
        .support = vm["support"].as<bool>()};
  }
  if (payload == "execute_proposal") {
    return pharbit::schema::execute_proposal_t{
        .proposal_id = vm["proposal-id"].as<uint64_t>()};
  }
  if (payload == "set_paused") {
    return pharbit::schema::set_paused_t{.paused = vm["paused"].as<bool>()};
  }
  pharbit::common::critical("unsupported payload type");
}

pharbit::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/info" || path == "/parameters" || path == "/stakeholders" ||
      path == "/governance/owners" || path == "/governance/quorum") {
    return {};
  }
  if (path == "/roles" || path == "/stakeholder") {
    return encoder.encode(get_identity(vm, "subject"));
  }
  if (path == "/batches/by_custodian") {
    return encoder.encode(get_identity(vm, "custodian"));
  }
  if (path == "/batch" || path == "/batch/transfers" ||
      path == "/batch/compliant" || path == "/telemetry/latest" ||
      path == "/telemetry/history" || path == "/telemetry/bounds" ||
      path == "/compliance/records" || path == "/audit/trail") {
    return encoder.encode(get_string(vm, "batch-id"));
  }
  if (path == "/batch/expired") {
    return encoder.encode(
        std::tuple{get_string(vm, "batch-id"), vm["now"].as<uint64_t>()});
  }
  if (path == "/telemetry/reading") {
    return encoder.encode(
        std::tuple{get_string(vm, "batch-id"), vm["index"].as<uint64_t>()});
  }
  if (path == "/compliance/record") {
    return encoder.encode(vm["record-id"].as<uint64_t>());
  }
  if (path == "/governance/proposal") {
    return encoder.encode(vm["proposal-id"].as<uint64_t>());
  }
  if (path == "/history" || path == "/events") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  pharbit::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder identity --name <label>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|identity")("payload", po::value<std::string>(),
                                        "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "caller", po::value<std::string>(), "caller identity hex")(
      "timestamp", po::value<uint64_t>()->default_value(0),
      "logical time of the command in ms")(
      "subject", po::value<std::string>(), "subject identity hex")(
      "role", po::value<std::string>(), "role name")(
      "name", po::value<std::string>(), "stakeholder or identity label")(
      "completed", po::value<bool>()->default_value(true), "KYC completed")(
      "reference", po::value<std::string>()->default_value(""),
      "KYC reference")("active", po::value<bool>()->default_value(true),
                       "stakeholder active")(
      "batch-id", po::value<std::string>(), "batch id")(
      "product-name", po::value<std::string>(), "product name")(
      "producer", po::value<std::string>(), "producer identity hex")(
      "quantity", po::value<uint64_t>()->default_value(1), "batch quantity")(
      "manufacture-date", po::value<uint64_t>()->default_value(0),
      "manufacture date ms")("expiry-date",
                             po::value<uint64_t>()->default_value(0),
                             "expiry date ms")(
      "custodian", po::value<std::string>(), "custodian identity hex")(
      "status", po::value<std::string>(), "batch status name")(
      "reason", po::value<std::string>()->default_value(""),
      "status or transfer reason")(
      "new-custodian", po::value<std::string>(), "new custodian identity hex")(
      "location", po::value<std::string>(), "transfer or reading location")(
      "min-temperature", po::value<int32_t>()->default_value(20),
      "minimum temperature in tenths of a degree")(
      "max-temperature", po::value<int32_t>()->default_value(80),
      "maximum temperature in tenths of a degree")(
      "max-humidity", po::value<uint32_t>()->default_value(1000),
      "maximum humidity in tenths of a percent")(
      "device", po::value<std::string>(), "sensor device identity hex")(
      "temperature", po::value<int32_t>()->default_value(0),
      "reading temperature")("humidity",
                             po::value<uint32_t>()->default_value(0),
                             "reading humidity")(
      "recorded-at", po::value<uint64_t>()->default_value(0),
      "reading timestamp ms, 0 for now")(
      "check-type", po::value<std::string>(), "compliance check type")(
      "notes", po::value<std::string>()->default_value(""), "notes")(
      "findings", po::value<std::string>()->default_value(""), "findings")(
      "corrective-actions", po::value<std::string>()->default_value(""),
      "corrective actions")(
      "evidence", po::value<std::vector<std::string>>()->multitoken(),
      "evidence references")("record-id",
                             po::value<uint64_t>()->default_value(0),
                             "compliance record id")(
      "compliance-status", po::value<std::string>(),
      "compliance status name")("passed",
                                po::value<bool>()->default_value(false),
                                "compliance passed flag")(
      "audit-type", po::value<std::string>(), "audit type")(
      "recommendations", po::value<std::string>()->default_value(""),
      "audit recommendations")("result",
                               po::value<std::string>()->default_value(""),
                               "audit result")(
      "owner", po::value<std::string>(), "governance owner identity hex")(
      "quorum", po::value<uint32_t>()->default_value(1), "governance quorum")(
      "description", po::value<std::string>(), "proposal description")(
      "voting-period", po::value<uint64_t>()->default_value(3'600'000),
      "voting period ms")("action",
                          po::value<std::string>()->default_value("none"),
                          "proposal action")(
      "window", po::value<uint64_t>()->default_value(86'400'000),
      "telemetry staleness window ms")(
      "proposal-id", po::value<uint64_t>()->default_value(1), "proposal id")(
      "support", po::value<bool>()->default_value(true), "vote support")(
      "paused", po::value<bool>()->default_value(true), "pause flag")(
      "now", po::value<uint64_t>()->default_value(0), "query time ms")(
      "index", po::value<uint64_t>()->default_value(0), "reading index")(
      "from", po::value<uint64_t>()->default_value(1), "range from")(
      "to", po::value<uint64_t>()->default_value(1), "range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      pharbit::common::critical("transaction mode requires --payload");
    }
    auto transaction = pharbit::schema::transaction_t{
        .version = 1,
        .caller = get_identity(vm, "caller"),
        .timestamp = vm["timestamp"].as<uint64_t>(),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << pharbit::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      pharbit::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << pharbit::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "identity") {
    auto identity = pharbit::blake3::hash(get_string(vm, "name"));
    std::cout << pharbit::schema::to_hex(identity) << '\n';
    return 0;
  }

  pharbit::common::critical("command must be transaction|query-key|identity");
}
