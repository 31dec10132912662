#pragma once
#include <mnemo/schema/primitives.hpp>
#include <optional>
#include <span>

namespace mnemo::schema::encoding {

/// Build-time selected codec. Specialized per wire library; stores take
/// the specialization they persist with.
template <typename Library>
struct encoder {
  template <typename T>
  mnemo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, mnemo::schema::bytes_t& out);

  template <typename T>
  T decode(const mnemo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const mnemo::schema::bytes_view_t& bytes);
};

}  // namespace mnemo::schema::encoding
