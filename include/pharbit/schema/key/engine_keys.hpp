#pragma once

#include <boost/endian/conversion.hpp>
#include <pharbit/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Supply chain workflow: canonical key prefixes for genesis, the committed
// checkpoint, transaction history and the event feed.
namespace pharbit::schema::key {

inline constexpr std::string_view kGenesisKey{"SYS|GENESIS"};
inline constexpr std::string_view kCommittedKey{"SYS|APP|COMMITTED"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder>
pharbit::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

/// Sequence keys append the sequence big-endian so that a prefix scan walks
/// them in commit order.
template <typename Encoder>
pharbit::schema::bytes_t make_sequence_key(Encoder& encoder,
                                           std::string_view prefix,
                                           uint64_t sequence) {
  auto key = make_prefix_key(encoder, prefix);
  auto big_endian = boost::endian::native_to_big(sequence);
  auto raw = std::array<uint8_t, sizeof(big_endian)>{};
  std::memcpy(raw.data(), &big_endian, sizeof(big_endian));
  key.insert(std::end(key), std::begin(raw), std::end(raw));
  return key;
}

/// Recover the sequence from a key built by `make_sequence_key`.
inline std::optional<uint64_t> parse_sequence_key(
    const pharbit::schema::bytes_view_t& key,
    const pharbit::schema::bytes_view_t& prefix_key) {
  if (key.size() != prefix_key.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto big_endian = uint64_t{};
  std::memcpy(&big_endian, key.data() + prefix_key.size(), sizeof(big_endian));
  return boost::endian::big_to_native(big_endian);
}

template <typename Encoder>
pharbit::schema::bytes_t make_genesis_key(Encoder& encoder) {
  return make_prefix_key(encoder, kGenesisKey);
}

template <typename Encoder>
pharbit::schema::bytes_t make_committed_key(Encoder& encoder) {
  return make_prefix_key(encoder, kCommittedKey);
}

template <typename Encoder>
pharbit::schema::bytes_t make_history_key(Encoder& encoder,
                                          uint64_t sequence) {
  return make_sequence_key(encoder, kHistoryPrefix, sequence);
}

template <typename Encoder>
pharbit::schema::bytes_t make_event_key(Encoder& encoder, uint64_t sequence) {
  return make_sequence_key(encoder, kEventPrefix, sequence);
}

}  // namespace pharbit::schema::key
