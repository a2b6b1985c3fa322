#pragma once
#include <pharbit/common/critical.hpp>
#include <pharbit/schema/encoding/encoder.hpp>
#include <pharbit/schema/encoding/scale/batch_status.hpp>
#include <pharbit/schema/encoding/scale/compliance_status.hpp>
#include <pharbit/schema/encoding/scale/role_id.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace pharbit::schema::encoding {

// Schema structs are plain aggregates; the codec encodes them field by field
// in declaration order, enums by their underlying integer (rejecting values
// outside the declared list on decode), variants with a leading alternative
// index.
struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  pharbit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, pharbit::schema::bytes_t& out);

  template <typename T>
  T decode(const pharbit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const pharbit::schema::bytes_view_t& bytes);
};

template <typename T>
pharbit::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    pharbit::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        pharbit::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const pharbit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    pharbit::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const pharbit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace pharbit::schema::encoding
