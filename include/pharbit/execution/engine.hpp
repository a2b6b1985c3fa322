#pragma once

#include <pharbit/execution/ledger_state.hpp>
#include <pharbit/schema/app_info.hpp>
#include <pharbit/schema/block_result.hpp>
#include <pharbit/schema/genesis.hpp>
#include <pharbit/schema/history_entry.hpp>
#include <pharbit/schema/ledger_event.hpp>
#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/query_result.hpp>
#include <pharbit/schema/replay_result.hpp>
#include <pharbit/schema/transaction.hpp>
#include <pharbit/schema/transaction_result.hpp>
#include <pharbit/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pharbit::execution {

/// Invoked once per committed command, in commit order, after the writer
/// lock is released. Listeners may query or submit; events committed from
/// inside a listener are delivered once it returns.
using event_listener_t =
    std::function<void(const pharbit::schema::ledger_event_t&)>;

/// Durable, serialised supply chain ledger.
///
/// Writers are serialised; every command runs against the latest published
/// snapshot and either commits wholly (history row, event and checkpoint in
/// one write batch, then a new snapshot) or leaves everything untouched.
/// Readers work on immutable snapshots and never wait for a command to
/// finish executing.
class engine final {
 public:
  /// Open (or create) the ledger at `db_path`.
  ///
  /// `genesis` seeds a new ledger and is persisted with it; an existing
  /// ledger keeps the genesis it was created with. Persisted history is
  /// replayed on open and must reproduce the committed state root.
  explicit engine(std::string db_path, pharbit::schema::genesis_t genesis = {});

  /// Execute and commit one command.
  pharbit::schema::transaction_result_t submit(
      const pharbit::schema::transaction_t& tx);

  /// Decode SCALE transaction bytes, then execute and commit.
  pharbit::schema::transaction_result_t execute_transaction(
      const pharbit::schema::bytes_view_t& raw_tx);

  /// Dry run against the current snapshot. Never commits.
  pharbit::schema::transaction_result_t check_transaction(
      const pharbit::schema::bytes_view_t& raw_tx) const;

  /// Execute an ordered list of encoded commands. Failures do not stop the
  /// list; each command keeps its own result.
  pharbit::schema::block_result_t finalize_block(
      const std::vector<pharbit::schema::bytes_t>& txs);

  /// Latest committed sequence, timestamp and state root.
  pharbit::schema::app_info_t info() const;

  /// Latest published state. The pointee never changes.
  std::shared_ptr<const ledger_state> snapshot() const;

  /// Routed read API returning SCALE-encoded projections.
  pharbit::schema::query_result_t query(
      std::string_view path,
      const pharbit::schema::bytes_view_t& data) const;

  /// Committed events with sequence in [from, to].
  std::vector<pharbit::schema::ledger_event_t> events(uint64_t from,
                                                      uint64_t to) const;

  /// Committed transactions with sequence in [from, to].
  std::vector<pharbit::schema::history_entry_t> history(uint64_t from,
                                                        uint64_t to) const;

  /// Re-run persisted history from genesis and check that it reproduces the
  /// live state root.
  pharbit::schema::replay_result_t replay_history() const;

  void set_event_listener(event_listener_t listener);

 private:
  struct ledger_head final {
    std::shared_ptr<const ledger_state> state;
    uint64_t sequence{};
    pharbit::schema::timestamp_milliseconds_t last_timestamp{};
    pharbit::schema::hash32_t state_root{};
  };

  /// Validate, apply and persist one decoded command. Requires
  /// `write_mutex_`.
  pharbit::schema::transaction_result_t commit_transaction(
      const pharbit::schema::transaction_t& tx,
      const pharbit::schema::bytes_t& raw_tx);

  /// Decode then commit. Requires `write_mutex_`.
  pharbit::schema::transaction_result_t execute_locked(
      const pharbit::schema::bytes_view_t& raw_tx);

  /// Hand queued events to the listener. One caller drains at a time.
  void deliver_events();

  ledger_head head() const;
  void publish(ledger_head next);

  /// Persist genesis on first open, then replay history and verify it.
  void load_persisted_state(const pharbit::schema::genesis_t& genesis);

  std::string db_path_;
  pharbit::storage::storage<pharbit::storage::rocksdb_storage_tag> storage_;
  pharbit::schema::genesis_t genesis_;
  mutable std::mutex write_mutex_;
  mutable std::shared_mutex head_mutex_;
  ledger_head head_;
  event_listener_t listener_;
  std::vector<pharbit::schema::ledger_event_t> pending_events_;
  bool delivering_{false};
};

}  // namespace pharbit::execution
