#include <mnemo/schema/encoding/scale/memory_source.hpp>
#include <mnemo/schema/encoding/scale/primitives.hpp>

using namespace mnemo::schema::encoding::scale;

namespace mnemo::schema {

void encode(const memory_source<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_enum(o.type, encoder);
  ::scale::encode(o.identifier, encoder);
  ::scale::encode(o.timestamp, encoder);
  ::scale::encode(o.metadata, encoder);
}

void decode(memory_source<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_enum(o.type, decoder);
  ::scale::decode(o.identifier, decoder);
  ::scale::decode(o.timestamp, decoder);
  ::scale::decode(o.metadata, decoder);
}

}  // namespace mnemo::schema
