#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: SLO type.
// Which service level objective a violation refers to.
namespace mnemo::schema {

enum class slo_type_t : uint8_t {
  freshness = 0,
  relevance = 1,
  recall = 2,
  cross_session = 3
};

inline constexpr auto kSloTypeMappings = std::array{
    std::pair<std::string_view, slo_type_t>{"freshness", slo_type_t::freshness},
    std::pair<std::string_view, slo_type_t>{"relevance", slo_type_t::relevance},
    std::pair<std::string_view, slo_type_t>{"recall", slo_type_t::recall},
    std::pair<std::string_view, slo_type_t>{"cross_session", slo_type_t::cross_session}};

template <>
inline std::optional<slo_type_t> try_from_string<slo_type_t>(
    const std::string_view value) {
  return from_string(value, kSloTypeMappings);
}

inline constexpr std::string_view to_string(const slo_type_t value) {
  return to_string(value, kSloTypeMappings).value_or("unknown");
}

}  // namespace mnemo::schema
