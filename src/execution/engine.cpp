#include <spdlog/spdlog.h>
#include <pharbit/blake3/hash.hpp>
#include <pharbit/common/critical.hpp>
#include <pharbit/execution/access_registry.hpp>
#include <pharbit/execution/batch_ledger.hpp>
#include <pharbit/execution/compliance_engine.hpp>
#include <pharbit/execution/engine.hpp>
#include <pharbit/execution/governance.hpp>
#include <pharbit/execution/stakeholder_directory.hpp>
#include <pharbit/execution/state_machine.hpp>
#include <pharbit/execution/telemetry_validator.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <pharbit/schema/key/engine_keys.hpp>
#include <pharbit/schema/query_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace pharbit::schema;

namespace {

using encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;
using storage_t =
    pharbit::storage::storage<pharbit::storage::rocksdb_storage_tag>;

bytes_view_t view_of(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(
    const pharbit::execution::command_error& error,
    std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = error.message;
  result.info = std::string{to_string(error.kind())};
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_decode_error_result(const std::string& error) {
  return make_error_result(
      pharbit::execution::make_error(error_code::invalid_transaction, error),
      "pharbit.ledger");
}

hash32_t genesis_root(const genesis_t& genesis) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(genesis);
  return pharbit::blake3::hash(view_of(encoded));
}

// Each digest covers its predecessor, so the newest digest commits to the
// whole feed back to genesis.
hash32_t digest_event(const ledger_event_t& event) {
  auto encoder = encoder_t{};
  auto material =
      encoder.encode(std::tuple{event.previous_digest, event.sequence,
                                event.type, event.entity_id, event.caller,
                                event.timestamp, event.attributes});
  return pharbit::blake3::hash(view_of(material));
}

ledger_event_t make_event(uint64_t sequence,
                          const hash32_t& previous_digest,
                          const transaction_t& tx,
                          const pharbit::execution::command_effect& effect) {
  auto event = ledger_event_t{};
  event.sequence = sequence;
  event.type = effect.type;
  event.entity_id = effect.entity_id;
  event.caller = tx.caller;
  event.timestamp = tx.timestamp;
  event.attributes = effect.attributes;
  event.previous_digest = previous_digest;
  event.digest = digest_event(event);
  return event;
}

transaction_result_t make_success_result(
    const transaction_t& tx,
    const pharbit::execution::command_effect& effect,
    uint64_t sequence) {
  auto result = transaction_result_t{};
  result.code = 0;
  result.data = effect.data;
  result.log = "ok";
  result.info = std::string{pharbit::execution::command_name(tx.payload)};
  result.codespace =
      std::string{pharbit::execution::codespace_of(tx.payload)};
  result.sequence = sequence;
  auto event = transaction_event_t{};
  event.type = effect.type;
  event.attributes = effect.attributes;
  result.events.push_back(std::move(event));
  return result;
}

struct rebuilt_ledger final {
  pharbit::execution::ledger_state state;
  uint64_t tx_count{};
  uint64_t applied{};
  timestamp_milliseconds_t last_timestamp{};
  hash32_t state_root{};
  std::string error;
};

// Recompute state and digests from genesis through every persisted history
// row. Stops at the first row that cannot be replayed.
rebuilt_ledger rebuild(const storage_t& storage, const genesis_t& genesis) {
  auto encoder = encoder_t{};
  auto rebuilt = rebuilt_ledger{};
  rebuilt.state = pharbit::execution::make_genesis_state(genesis);
  rebuilt.state_root = genesis_root(genesis);

  auto prefix = pharbit::schema::key::make_prefix_key(
      encoder, pharbit::schema::key::kHistoryPrefix);
  auto rows = storage.list_by_prefix(view_of(prefix));
  rebuilt.tx_count = rows.size();
  for (const auto& [row_key, row_value] : rows) {
    auto expected = rebuilt.applied + 1;
    auto entry = encoder.try_decode<history_entry_t>(view_of(row_value));
    if (!entry) {
      rebuilt.error =
          "undecodable history row at sequence " + std::to_string(expected);
      break;
    }
    if (entry->sequence != expected) {
      rebuilt.error = "history gap: expected sequence " +
                      std::to_string(expected) + ", found " +
                      std::to_string(entry->sequence);
      break;
    }
    auto tx = encoder.try_decode<transaction_t>(view_of(entry->tx));
    if (!tx) {
      rebuilt.error =
          "undecodable transaction at sequence " + std::to_string(expected);
      break;
    }
    auto outcome = pharbit::execution::apply_transaction(rebuilt.state, *tx);
    if (auto* error =
            std::get_if<pharbit::execution::command_error>(&outcome)) {
      rebuilt.error = "sequence " + std::to_string(expected) +
                      " rejected on replay: " + error->message;
      break;
    }
    auto& transition =
        std::get<pharbit::execution::state_transition>(outcome);
    auto event =
        make_event(expected, rebuilt.state_root, *tx, transition.effect);
    rebuilt.state = std::move(transition.state);
    rebuilt.state_root = event.digest;
    rebuilt.last_timestamp = tx->timestamp;
    rebuilt.applied = expected;
  }
  return rebuilt;
}

template <typename T>
std::vector<T> load_range(const storage_t& storage,
                          std::string_view prefix,
                          uint64_t from,
                          uint64_t to) {
  auto encoder = encoder_t{};
  auto prefix_key = pharbit::schema::key::make_prefix_key(encoder, prefix);
  auto values = std::vector<T>{};
  if (from > to) {
    return values;
  }
  for (const auto& [key, value] : storage.list_by_prefix(view_of(prefix_key))) {
    auto sequence = pharbit::schema::key::parse_sequence_key(
        view_of(key), view_of(prefix_key));
    if (!sequence || *sequence < from || *sequence > to) {
      continue;
    }
    auto decoded = encoder.try_decode<T>(view_of(value));
    if (!decoded) {
      spdlog::warn("Skipping undecodable row at sequence {}", *sequence);
      continue;
    }
    values.push_back(std::move(*decoded));
  }
  return values;
}

template <typename T>
std::optional<T> decode_key(const bytes_view_t& data) {
  auto encoder = encoder_t{};
  return encoder.try_decode<T>(data);
}

}  // namespace

namespace pharbit::execution {

engine::engine(std::string db_path, genesis_t genesis)
    : db_path_(std::move(db_path)) {
  auto lock = std::scoped_lock{write_mutex_};
  spdlog::info("Initializing ledger engine with RocksDB path '{}'", db_path_);
  storage_ =
      pharbit::storage::make_storage<pharbit::storage::rocksdb_storage_tag>(
          db_path_);
  load_persisted_state(genesis);
  spdlog::info("Ledger engine ready at sequence {} with state root {}",
               head_.sequence, to_hex(head_.state_root));
}

transaction_result_t engine::submit(const transaction_t& tx) {
  auto result = transaction_result_t{};
  {
    auto lock = std::scoped_lock{write_mutex_};
    auto encoder = encoder_t{};
    auto raw_tx = encoder.encode(tx);
    result = commit_transaction(tx, raw_tx);
  }
  deliver_events();
  return result;
}

transaction_result_t engine::execute_transaction(const bytes_view_t& raw_tx) {
  auto result = transaction_result_t{};
  {
    auto lock = std::scoped_lock{write_mutex_};
    result = execute_locked(raw_tx);
  }
  deliver_events();
  return result;
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_decode_error_result(decode_error);
  }
  auto current = head();
  if (maybe_tx->timestamp < current.last_timestamp) {
    return make_error_result(
        make_error(error_code::clock_regression,
                   "timestamp precedes the last committed command"),
        codespace_of(maybe_tx->payload));
  }
  auto outcome = apply_transaction(*current.state, *maybe_tx);
  if (auto* error = std::get_if<command_error>(&outcome)) {
    return make_error_result(*error, codespace_of(maybe_tx->payload));
  }
  return make_success_result(*maybe_tx,
                             std::get<state_transition>(outcome).effect, 0);
}

block_result_t engine::finalize_block(const std::vector<bytes_t>& txs) {
  auto result = block_result_t{};
  {
    auto lock = std::scoped_lock{write_mutex_};
    result.tx_results.reserve(txs.size());
    for (const auto& tx : txs) {
      result.tx_results.push_back(execute_locked(view_of(tx)));
    }
    result.state_root = head().state_root;
  }
  deliver_events();
  return result;
}

app_info_t engine::info() const {
  auto current = head();
  auto result = app_info_t{};
  result.last_sequence = current.sequence;
  result.last_timestamp = current.last_timestamp;
  result.state_root = current.state_root;
  return result;
}

std::shared_ptr<const ledger_state> engine::snapshot() const {
  return head().state;
}

query_result_t engine::query(std::string_view path,
                             const bytes_view_t& data) const {
  auto current = head();
  const auto& state = *current.state;
  auto encoder = encoder_t{};

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.sequence = current.sequence;
  result.codespace = "pharbit.query";

  auto fail = [&](query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    return result;
  };
  auto respond = [&](const auto& value) {
    result.value = encoder.encode(value);
    return result;
  };
  auto respond_or_fail = [&](const auto& outcome) {
    if (auto* error = std::get_if<command_error>(&outcome)) {
      result.info = std::string{to_string(error->kind())};
      return fail(query_error_code::not_found, error->message);
    }
    return respond(std::get<0>(outcome));
  };
  auto invalid_key = [&] {
    return fail(query_error_code::invalid_key, "invalid query key");
  };

  if (path == "/info") {
    return respond(info());
  }
  if (path == "/parameters") {
    return respond(state.parameters);
  }
  if (path == "/roles") {
    auto identity = decode_key<identity_t>(data);
    if (!identity) {
      return invalid_key();
    }
    return respond(roles_of(state, *identity));
  }
  if (path == "/stakeholder") {
    auto identity = decode_key<identity_t>(data);
    if (!identity) {
      return invalid_key();
    }
    return respond_or_fail(get_stakeholder(state, *identity));
  }
  if (path == "/stakeholders") {
    return respond(list_stakeholders(state));
  }
  if (path == "/batch") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond_or_fail(get_batch(state, *batch_id));
  }
  if (path == "/batch/transfers") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond_or_fail(custody_transfers(state, *batch_id));
  }
  if (path == "/batch/expired") {
    auto key = decode_key<std::tuple<batch_id_t, timestamp_milliseconds_t>>(
        data);
    if (!key) {
      return invalid_key();
    }
    return respond_or_fail(
        is_expired(state, std::get<0>(*key), std::get<1>(*key)));
  }
  if (path == "/batch/compliant") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond(is_batch_compliant(state, *batch_id));
  }
  if (path == "/batches/by_custodian") {
    auto identity = decode_key<identity_t>(data);
    if (!identity) {
      return invalid_key();
    }
    return respond(batches_by_custodian(state, *identity));
  }
  if (path == "/telemetry/latest") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond_or_fail(latest_reading(state, *batch_id));
  }
  if (path == "/telemetry/history") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond_or_fail(telemetry_history(state, *batch_id));
  }
  if (path == "/telemetry/reading") {
    auto key = decode_key<std::tuple<batch_id_t, uint64_t>>(data);
    if (!key) {
      return invalid_key();
    }
    return respond_or_fail(reading_at(state, std::get<0>(*key),
                                      static_cast<size_t>(std::get<1>(*key))));
  }
  if (path == "/telemetry/bounds") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond(bounds_for(state, *batch_id));
  }
  if (path == "/compliance/record") {
    auto record_id = decode_key<record_id_t>(data);
    if (!record_id) {
      return invalid_key();
    }
    return respond_or_fail(get_compliance_record(state, *record_id));
  }
  if (path == "/compliance/records") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond_or_fail(compliance_records(state, *batch_id));
  }
  if (path == "/audit/trail") {
    auto batch_id = decode_key<batch_id_t>(data);
    if (!batch_id) {
      return invalid_key();
    }
    return respond_or_fail(audit_trail(state, *batch_id));
  }
  if (path == "/governance/owners") {
    return respond(owners(state));
  }
  if (path == "/governance/quorum") {
    return respond(quorum(state));
  }
  if (path == "/governance/proposal") {
    auto proposal_id = decode_key<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid_key();
    }
    return respond_or_fail(get_proposal(state, *proposal_id));
  }
  if (path == "/history") {
    auto range = decode_key<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key();
    }
    return respond(history(std::get<0>(*range), std::get<1>(*range)));
  }
  if (path == "/events") {
    auto range = decode_key<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key();
    }
    return respond(events(std::get<0>(*range), std::get<1>(*range)));
  }
  return fail(query_error_code::unsupported_path,
              "unsupported query path " + std::string{path});
}

std::vector<ledger_event_t> engine::events(uint64_t from, uint64_t to) const {
  return load_range<ledger_event_t>(
      storage_, pharbit::schema::key::kEventPrefix, from, to);
}

std::vector<history_entry_t> engine::history(uint64_t from,
                                             uint64_t to) const {
  return load_range<history_entry_t>(
      storage_, pharbit::schema::key::kHistoryPrefix, from, to);
}

replay_result_t engine::replay_history() const {
  auto lock = std::scoped_lock{write_mutex_};
  auto current = head();
  auto rebuilt = rebuild(storage_, genesis_);

  auto result = replay_result_t{};
  result.tx_count = rebuilt.tx_count;
  result.applied_count = rebuilt.applied;
  result.state_root = rebuilt.state_root;
  result.error = rebuilt.error;
  if (result.error.empty() && rebuilt.applied != current.sequence) {
    result.error = "replayed " + std::to_string(rebuilt.applied) +
                   " command(s), committed " +
                   std::to_string(current.sequence);
  }
  if (result.error.empty() && rebuilt.state_root != current.state_root) {
    result.error = "replayed state root does not match committed root";
  }
  result.ok = result.error.empty();
  if (!result.ok) {
    spdlog::error("History replay failed: {}", result.error);
  }
  return result;
}

void engine::set_event_listener(event_listener_t listener) {
  auto lock = std::scoped_lock{write_mutex_};
  listener_ = std::move(listener);
}

void engine::deliver_events() {
  {
    auto lock = std::scoped_lock{write_mutex_};
    if (delivering_ || pending_events_.empty()) {
      return;
    }
    delivering_ = true;
  }

  while (true) {
    auto batch = std::vector<ledger_event_t>{};
    auto listener = event_listener_t{};
    {
      auto lock = std::scoped_lock{write_mutex_};
      if (pending_events_.empty()) {
        delivering_ = false;
        return;
      }
      batch.swap(pending_events_);
      listener = listener_;
    }
    try {
      for (const auto& event : batch) {
        if (listener) {
          listener(event);
        }
      }
    } catch (...) {
      auto lock = std::scoped_lock{write_mutex_};
      delivering_ = false;
      throw;
    }
  }
}

transaction_result_t engine::execute_locked(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    spdlog::debug("Rejecting undecodable transaction: {}", decode_error);
    return make_decode_error_result(decode_error);
  }
  return commit_transaction(*maybe_tx, make_bytes(raw_tx));
}

transaction_result_t engine::commit_transaction(const transaction_t& tx,
                                                const bytes_t& raw_tx) {
  auto current = head();
  if (tx.timestamp < current.last_timestamp) {
    return make_error_result(
        make_error(error_code::clock_regression,
                   "timestamp precedes the last committed command"),
        codespace_of(tx.payload));
  }

  auto outcome = apply_transaction(*current.state, tx);
  if (auto* error = std::get_if<command_error>(&outcome)) {
    return make_error_result(*error, codespace_of(tx.payload));
  }
  auto& transition = std::get<state_transition>(outcome);

  auto sequence = current.sequence + 1;
  auto event = make_event(sequence, current.state_root, tx, transition.effect);

  auto encoder = encoder_t{};
  auto entry = history_entry_t{};
  entry.sequence = sequence;
  entry.timestamp = tx.timestamp;
  entry.tx = raw_tx;
  auto entries = std::vector<pharbit::storage::key_value_entry_t>{
      {pharbit::schema::key::make_history_key(encoder, sequence),
       encoder.encode(entry)},
      {pharbit::schema::key::make_event_key(encoder, sequence),
       encoder.encode(event)}};
  storage_.commit(entries, pharbit::storage::committed_state{
                               .sequence = sequence,
                               .last_timestamp = tx.timestamp,
                               .state_root = event.digest});

  auto result = make_success_result(tx, transition.effect, sequence);
  auto next_state =
      std::make_shared<const ledger_state>(std::move(transition.state));
  publish(ledger_head{.state = std::move(next_state),
                      .sequence = sequence,
                      .last_timestamp = tx.timestamp,
                      .state_root = event.digest});
  spdlog::debug("Committed {} as sequence {}", command_name(tx.payload),
                sequence);

  if (listener_) {
    pending_events_.push_back(std::move(event));
  }
  return result;
}

engine::ledger_head engine::head() const {
  auto lock = std::shared_lock{head_mutex_};
  return head_;
}

void engine::publish(ledger_head next) {
  auto lock = std::unique_lock{head_mutex_};
  head_ = std::move(next);
}

void engine::load_persisted_state(const genesis_t& genesis) {
  spdlog::debug("Loading persisted ledger state");
  auto encoder = encoder_t{};
  auto genesis_key = pharbit::schema::key::make_genesis_key(encoder);
  auto stored = storage_.get<genesis_t>(encoder, view_of(genesis_key));
  if (stored) {
    genesis_ = *stored;
    if (encoder.encode(genesis) != encoder.encode(genesis_)) {
      spdlog::warn("Ignoring supplied genesis; ledger keeps its original one");
    }
  } else {
    if (auto error = validate_genesis(genesis)) {
      spdlog::error("Invalid genesis: {}", error->message);
      pharbit::common::critical("invalid genesis configuration");
    }
    genesis_ = genesis;
    storage_.commit({{genesis_key, encoder.encode(genesis_)}},
                    pharbit::storage::committed_state{
                        .sequence = 0,
                        .last_timestamp = 0,
                        .state_root = genesis_root(genesis_)});
    spdlog::info("Created new ledger with {} admin(s) and {} owner(s)",
                 genesis_.admins.size(), genesis_.owners.size());
  }

  auto committed = storage_.load_committed_state();
  if (!committed) {
    pharbit::common::critical("ledger has genesis but no committed state");
  }

  auto rebuilt = rebuild(storage_, genesis_);
  if (!rebuilt.error.empty()) {
    spdlog::error("History replay failed: {}", rebuilt.error);
    pharbit::common::critical("persisted history cannot be replayed");
  }
  if (rebuilt.applied != committed->sequence ||
      rebuilt.state_root != committed->state_root) {
    spdlog::error(
        "Replay diverged: sequence {} root {} vs committed {} root {}",
        rebuilt.applied, to_hex(rebuilt.state_root), committed->sequence,
        to_hex(committed->state_root));
    pharbit::common::critical("replayed state diverges from committed state");
  }

  head_ = ledger_head{
      .state = std::make_shared<const ledger_state>(std::move(rebuilt.state)),
      .sequence = committed->sequence,
      .last_timestamp = committed->last_timestamp,
      .state_root = committed->state_root};
}

}  // namespace pharbit::execution
