#include <mnemo/schema/encoding/scale/memory_version.hpp>
#include <mnemo/schema/encoding/scale/primitives.hpp>

using namespace mnemo::schema::encoding::scale;

namespace mnemo::schema {

void encode(const memory_version<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.content, encoder);
  ::scale::encode(o.content_type, encoder);
  ::scale::encode(o.tags, encoder);
  encode_real(o.importance, encoder);
  encode_real(o.task_criticality, encoder);
  ::scale::encode(o.superseded_at, encoder);
  ::scale::encode(o.superseded_by, encoder);
  ::scale::encode(o.change_reason, encoder);
}

void decode(memory_version<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.content, decoder);
  ::scale::decode(o.content_type, decoder);
  ::scale::decode(o.tags, decoder);
  decode_real(o.importance, decoder);
  decode_real(o.task_criticality, decoder);
  ::scale::decode(o.superseded_at, decoder);
  ::scale::decode(o.superseded_by, decoder);
  ::scale::decode(o.change_reason, decoder);
}

}  // namespace mnemo::schema
