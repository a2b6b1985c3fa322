#pragma once
#include <pharbit/schema/primitives.hpp>
#include <optional>
#include <span>

namespace pharbit::schema::encoding {

/// Build-time selected codec. The library is chosen by tag so that the
/// wire format can change without touching the code that encodes.
template <typename Library>
struct encoder {
  template <typename T>
  pharbit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, pharbit::schema::bytes_t& out);

  template <typename T>
  T decode(const pharbit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const pharbit::schema::bytes_view_t& bytes);
};

}  // namespace pharbit::schema::encoding
