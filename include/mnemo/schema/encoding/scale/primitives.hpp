#pragma once
#include <mnemo/schema/primitives.hpp>
#include <bit>
#include <cstdint>
#include <optional>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <type_traits>
#include <vector>

// SCALE has no floating point or open enum support; doubles travel as their
// IEEE-754 bit pattern and enums as their underlying integer.
namespace mnemo::schema::encoding::scale {

inline void encode_real(const double value, ::scale::Encoder& encoder) {
  ::scale::encode(std::bit_cast<uint64_t>(value), encoder);
}

inline void decode_real(double& value, ::scale::Decoder& decoder) {
  auto bits = uint64_t{};
  ::scale::decode(bits, decoder);
  value = std::bit_cast<double>(bits);
}

inline void encode_real(const std::optional<double>& value,
                        ::scale::Encoder& encoder) {
  auto bits = std::optional<uint64_t>{};
  if (value) {
    bits = std::bit_cast<uint64_t>(*value);
  }
  ::scale::encode(bits, encoder);
}

inline void decode_real(std::optional<double>& value,
                        ::scale::Decoder& decoder) {
  auto bits = std::optional<uint64_t>{};
  ::scale::decode(bits, decoder);
  value.reset();
  if (bits) {
    value = std::bit_cast<double>(*bits);
  }
}

void encode_embedding(const std::optional<embedding_t>& value,
                      ::scale::Encoder& encoder);
void decode_embedding(std::optional<embedding_t>& value,
                      ::scale::Decoder& decoder);

template <typename Enum>
void encode_enum(const Enum value, ::scale::Encoder& encoder) {
  ::scale::encode(static_cast<std::underlying_type_t<Enum>>(value), encoder);
}

template <typename Enum>
void decode_enum(Enum& value, ::scale::Decoder& decoder) {
  auto raw = std::underlying_type_t<Enum>{};
  ::scale::decode(raw, decoder);
  value = static_cast<Enum>(raw);
}

/// Length-prefixed sequence of records that carry their own encode/decode
/// overloads.
template <typename Record>
void encode_records(const std::vector<Record>& records,
                    ::scale::Encoder& encoder) {
  ::scale::encode(static_cast<uint32_t>(records.size()), encoder);
  for (const auto& record : records) {
    encode(record, encoder);
  }
}

template <typename Record>
void decode_records(std::vector<Record>& records, ::scale::Decoder& decoder) {
  auto size = uint32_t{};
  ::scale::decode(size, decoder);
  records.clear();
  records.resize(size);
  for (auto& record : records) {
    decode(record, decoder);
  }
}

}  // namespace mnemo::schema::encoding::scale
