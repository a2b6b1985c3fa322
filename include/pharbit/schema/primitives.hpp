#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pharbit::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using identity_t = hash32_t;  // Resolved upstream; opaque to the ledger.
using batch_id_t = std::string;
using record_id_t = uint64_t;
using proposal_id_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

inline constexpr duration_milliseconds_t kMillisecondsPerMinute = 60'000;
inline constexpr duration_milliseconds_t kMillisecondsPerDay = 86'400'000;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

/// Accepts 32 raw characters or 64 hex digits with an optional `0x` prefix.
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

}  // namespace pharbit::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
