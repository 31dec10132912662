#include <mnemo/schema/encoding/scale/ingestion_metadata.hpp>
#include <mnemo/schema/encoding/scale/memory_object.hpp>
#include <mnemo/schema/encoding/scale/memory_source.hpp>
#include <mnemo/schema/encoding/scale/memory_version.hpp>
#include <mnemo/schema/encoding/scale/namespace_id.hpp>
#include <mnemo/schema/encoding/scale/primitives.hpp>
#include <mnemo/schema/encoding/scale/provenance_entry.hpp>

using namespace mnemo::schema::encoding::scale;

namespace mnemo::schema {

void encode(const memory_object<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.memory_id, encoder);
  encode(o.ns, encoder);
  ::scale::encode(o.content, encoder);
  ::scale::encode(o.content_type, encoder);
  encode(o.source, encoder);
  encode(o.ingestion, encoder);
  encode_records(o.provenance, encoder);
  ::scale::encode(o.tags, encoder);
  encode_real(o.importance, encoder);
  encode_real(o.task_criticality, encoder);
  encode_embedding(o.embedding, encoder);
  ::scale::encode(o.created_at, encoder);
  ::scale::encode(o.last_accessed_at, encoder);
  ::scale::encode(o.ttl_seconds, encoder);
  ::scale::encode(o.expires_at, encoder);
  ::scale::encode(o.checkpoint_refs, encoder);
  ::scale::encode(o.version, encoder);
  encode_records(o.previous_versions, encoder);
  encode_enum(o.status, encoder);
  ::scale::encode(o.session_id, encoder);
  ::scale::encode(o.accessed_in_sessions, encoder);
  ::scale::encode(o.cross_session_recall_count, encoder);
}

void decode(memory_object<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.memory_id, decoder);
  decode(o.ns, decoder);
  ::scale::decode(o.content, decoder);
  ::scale::decode(o.content_type, decoder);
  decode(o.source, decoder);
  decode(o.ingestion, decoder);
  decode_records(o.provenance, decoder);
  ::scale::decode(o.tags, decoder);
  decode_real(o.importance, decoder);
  decode_real(o.task_criticality, decoder);
  decode_embedding(o.embedding, decoder);
  ::scale::decode(o.created_at, decoder);
  ::scale::decode(o.last_accessed_at, decoder);
  ::scale::decode(o.ttl_seconds, decoder);
  ::scale::decode(o.expires_at, decoder);
  ::scale::decode(o.checkpoint_refs, decoder);
  ::scale::decode(o.version, decoder);
  decode_records(o.previous_versions, decoder);
  decode_enum(o.status, decoder);
  ::scale::decode(o.session_id, decoder);
  ::scale::decode(o.accessed_in_sessions, decoder);
  ::scale::decode(o.cross_session_recall_count, decoder);
}

}  // namespace mnemo::schema
