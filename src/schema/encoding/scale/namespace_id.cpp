#include <mnemo/schema/encoding/scale/namespace_id.hpp>

namespace mnemo::schema {

void encode(const namespace_id<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.org_id, encoder);
  ::scale::encode(o.app_id, encoder);
  ::scale::encode(o.agent_id, encoder);
  ::scale::encode(o.user_id, encoder);
}

void decode(namespace_id<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.org_id, decoder);
  ::scale::decode(o.app_id, decoder);
  ::scale::decode(o.agent_id, decoder);
  ::scale::decode(o.user_id, decoder);
}

}  // namespace mnemo::schema
