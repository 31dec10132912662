#include <mnemo/schema/encoding/scale/primitives.hpp>

namespace mnemo::schema::encoding::scale {

void encode_embedding(const std::optional<embedding_t>& value,
                      ::scale::Encoder& encoder) {
  auto bits = std::optional<std::vector<uint64_t>>{};
  if (value) {
    bits.emplace();
    bits->reserve(value->size());
    for (const auto component : *value) {
      bits->push_back(std::bit_cast<uint64_t>(component));
    }
  }
  ::scale::encode(bits, encoder);
}

void decode_embedding(std::optional<embedding_t>& value,
                      ::scale::Decoder& decoder) {
  auto bits = std::optional<std::vector<uint64_t>>{};
  ::scale::decode(bits, decoder);
  value.reset();
  if (!bits) {
    return;
  }
  value.emplace();
  value->reserve(bits->size());
  for (const auto component : *bits) {
    value->push_back(std::bit_cast<double>(component));
  }
}

}  // namespace mnemo::schema::encoding::scale
