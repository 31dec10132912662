#pragma once

#include <mnemo/schema/provenance_entry.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const provenance_entry<1>& o, ::scale::Encoder& encoder);
void decode(provenance_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
