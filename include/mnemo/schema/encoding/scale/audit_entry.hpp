#pragma once

#include <mnemo/schema/audit_entry.hpp>
#include <scale/scale.hpp>

namespace mnemo::schema {

void encode(const audit_entry<1>& o, ::scale::Encoder& encoder);
void decode(audit_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace mnemo::schema
