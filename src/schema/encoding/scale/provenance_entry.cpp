#include <mnemo/schema/encoding/scale/primitives.hpp>
#include <mnemo/schema/encoding/scale/provenance_entry.hpp>

using namespace mnemo::schema::encoding::scale;

namespace mnemo::schema {

void encode(const provenance_entry<1>& o, ::scale::Encoder& encoder) {
  encode_enum(o.action, encoder);
  ::scale::encode(o.actor_id, encoder);
  ::scale::encode(o.checkpoint_id, encoder);
  ::scale::encode(o.timestamp, encoder);
  ::scale::encode(o.reason, encoder);
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.merged_from, encoder);
  ::scale::encode(o.previous_content, encoder);
}

void decode(provenance_entry<1>& o, ::scale::Decoder& decoder) {
  decode_enum(o.action, decoder);
  ::scale::decode(o.actor_id, decoder);
  ::scale::decode(o.checkpoint_id, decoder);
  ::scale::decode(o.timestamp, decoder);
  ::scale::decode(o.reason, decoder);
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.merged_from, decoder);
  ::scale::decode(o.previous_content, decoder);
}

}  // namespace mnemo::schema
