#pragma once

#include <pharbit/execution/engine.hpp>
#include <pharbit/schema/encoding/scale/encoder.hpp>
#include <pharbit/testing/common.hpp>
#include <pharbit/testing/ledger_fixture.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace pharbit::testing {

using scale_encoder_t = pharbit::schema::encoding::encoder<
    pharbit::schema::encoding::scale_encoder_tag>;

/// Owns a temporary RocksDB directory and an engine opened on it. The
/// engine can be closed and reopened to exercise restart paths.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)} {
    reopen();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  const actors& who() const { return who_; }
  pharbit::execution::engine& engine() { return *engine_; }

  void reopen() {
    engine_.reset();
    engine_ = std::make_unique<pharbit::execution::engine>(
        db_path_, make_test_genesis(who_));
  }

  pharbit::schema::timestamp_milliseconds_t tick() { return now_ += 1000; }
  pharbit::schema::timestamp_milliseconds_t now() const { return now_; }

  pharbit::schema::transaction_t make_tx(
      const pharbit::schema::identity_t& caller,
      const pharbit::schema::transaction_payload_t& payload) {
    return pharbit::schema::transaction_t{.version = 1,
                                          .caller = caller,
                                          .timestamp = tick(),
                                          .payload = payload};
  }

  pharbit::schema::transaction_result_t submit(
      const pharbit::schema::identity_t& caller,
      const pharbit::schema::transaction_payload_t& payload) {
    return engine_->submit(make_tx(caller, payload));
  }

  pharbit::schema::bytes_t encode(const pharbit::schema::transaction_t& tx) {
    return encoder_.encode(tx);
  }

  scale_encoder_t& encoder() { return encoder_; }

 private:
  std::string db_path_;
  actors who_;
  scale_encoder_t encoder_;
  std::unique_ptr<pharbit::execution::engine> engine_;
  pharbit::schema::timestamp_milliseconds_t now_{kGenesisTime};
};

}  // namespace pharbit::testing
