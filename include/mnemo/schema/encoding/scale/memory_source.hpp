#pragma once

#include <mnemo/schema/memory_source.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const memory_source<1>& o, ::scale::Encoder& encoder);
void decode(memory_source<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
