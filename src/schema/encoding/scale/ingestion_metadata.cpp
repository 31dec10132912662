#include <mnemo/schema/encoding/scale/ingestion_metadata.hpp>
#include <mnemo/schema/encoding/scale/primitives.hpp>

using namespace mnemo::schema::encoding::scale;

namespace mnemo::schema {

void encode(const ingestion_metadata<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_enum(o.source_type, encoder);
  ::scale::encode(o.source_id, encoder);
  ::scale::encode(o.ingestion_timestamp, encoder);
  encode_real(o.confidence_score, encoder);
  encode_enum(o.detected_format, encoder);
  ::scale::encode(o.anomaly_flags, encoder);
  ::scale::encode(o.quarantined, encoder);
  ::scale::encode(o.validation_notes, encoder);
}

void decode(ingestion_metadata<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_enum(o.source_type, decoder);
  ::scale::decode(o.source_id, decoder);
  ::scale::decode(o.ingestion_timestamp, decoder);
  decode_real(o.confidence_score, decoder);
  decode_enum(o.detected_format, decoder);
  ::scale::decode(o.anomaly_flags, decoder);
  ::scale::decode(o.quarantined, decoder);
  ::scale::decode(o.validation_notes, decoder);
}

}  // namespace mnemo::schema
