#pragma once

#include <mnemo/schema/memory_version.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const memory_version<1>& o, ::scale::Encoder& encoder);
void decode(memory_version<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
