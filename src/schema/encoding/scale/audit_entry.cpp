#include <mnemo/schema/encoding/scale/audit_entry.hpp>
#include <mnemo/schema/encoding/scale/namespace_id.hpp>
#include <mnemo/schema/encoding/scale/primitives.hpp>

using namespace mnemo::schema::encoding::scale;

namespace mnemo::schema {

void encode(const audit_entry<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.id, encoder);
  encode(o.ns, encoder);
  encode_enum(o.action, encoder);
  ::scale::encode(o.resource_type, encoder);
  ::scale::encode(o.resource_id, encoder);
  ::scale::encode(o.actor_id, encoder);
  ::scale::encode(o.timestamp, encoder);
  ::scale::encode(o.metadata, encoder);
}

void decode(audit_entry<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.id, decoder);
  decode(o.ns, decoder);
  decode_enum(o.action, decoder);
  ::scale::decode(o.resource_type, decoder);
  ::scale::decode(o.resource_id, decoder);
  ::scale::decode(o.actor_id, decoder);
  ::scale::decode(o.timestamp, decoder);
  ::scale::decode(o.metadata, decoder);
}

}  // namespace mnemo::schema
