#pragma once
#include <mnemo/common/critical.hpp>
#include <mnemo/schema/encoding/encoder.hpp>
#include <mnemo/schema/encoding/scale/audit_entry.hpp>
#include <mnemo/schema/encoding/scale/ingestion_metadata.hpp>
#include <mnemo/schema/encoding/scale/memory_object.hpp>
#include <mnemo/schema/encoding/scale/memory_source.hpp>
#include <mnemo/schema/encoding/scale/memory_version.hpp>
#include <mnemo/schema/encoding/scale/namespace_id.hpp>
#include <mnemo/schema/encoding/scale/primitives.hpp>
#include <mnemo/schema/encoding/scale/provenance_entry.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace mnemo::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  mnemo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, mnemo::schema::bytes_t& out);

  template <typename T>
  T decode(const mnemo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const mnemo::schema::bytes_view_t& bytes);
};

template <typename T>
mnemo::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    mnemo::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        mnemo::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const mnemo::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    mnemo::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const mnemo::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace mnemo::schema::encoding
