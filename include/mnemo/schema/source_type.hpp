#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: memory source type.
// Where a memory originated; drives ingestion trust.
namespace mnemo::schema {

enum class source_type_t : uint8_t {
  user_input = 0,
  tool_output = 1,
  web_scrape = 2,
  agent_inference = 3,
  external = 4,
  system = 5
};

inline constexpr auto kSourceTypeMappings = std::array{
    std::pair<std::string_view, source_type_t>{"user_input", source_type_t::user_input},
    std::pair<std::string_view, source_type_t>{"tool_output", source_type_t::tool_output},
    std::pair<std::string_view, source_type_t>{"web_scrape", source_type_t::web_scrape},
    std::pair<std::string_view, source_type_t>{"agent_inference", source_type_t::agent_inference},
    std::pair<std::string_view, source_type_t>{"external", source_type_t::external},
    std::pair<std::string_view, source_type_t>{"system", source_type_t::system}};

template <>
inline std::optional<source_type_t> try_from_string<source_type_t>(
    const std::string_view value) {
  return from_string(value, kSourceTypeMappings);
}

inline constexpr std::string_view to_string(const source_type_t value) {
  return to_string(value, kSourceTypeMappings).value_or("unknown");
}

}  // namespace mnemo::schema
