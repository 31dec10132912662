#pragma once

#include <mnemo/schema/namespace_id.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const namespace_id<1>& o, ::scale::Encoder& encoder);
void decode(namespace_id<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
