#pragma once
#include <pharbit/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace pharbit::storage {

using key_value_entry_t =
    std::pair<pharbit::schema::bytes_t, pharbit::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  pharbit::schema::timestamp_milliseconds_t last_timestamp{};
  pharbit::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const pharbit::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const pharbit::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Atomically write entries together with the new committed checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const pharbit::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace pharbit::storage
