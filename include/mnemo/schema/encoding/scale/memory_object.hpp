#pragma once

#include <mnemo/schema/memory_object.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const memory_object<1>& o, ::scale::Encoder& encoder);
void decode(memory_object<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
