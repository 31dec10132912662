#pragma once

#include <mnemo/schema/ingestion_metadata.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const ingestion_metadata<1>& o, ::scale::Encoder& encoder);
void decode(ingestion_metadata<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
