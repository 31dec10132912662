#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: content format.
// Format detected by ingestion validation.
namespace mnemo::schema {

enum class content_format_t : uint8_t {
  text = 0,
  json = 1,
  html = 2,
  markdown = 3
};

inline constexpr auto kContentFormatMappings = std::array{
    std::pair<std::string_view, content_format_t>{"text", content_format_t::text},
    std::pair<std::string_view, content_format_t>{"json", content_format_t::json},
    std::pair<std::string_view, content_format_t>{"html", content_format_t::html},
    std::pair<std::string_view, content_format_t>{"markdown", content_format_t::markdown}};

template <>
inline std::optional<content_format_t> try_from_string<content_format_t>(
    const std::string_view value) {
  return from_string(value, kContentFormatMappings);
}

inline constexpr std::string_view to_string(const content_format_t value) {
  return to_string(value, kContentFormatMappings).value_or("unknown");
}

}  // namespace mnemo::schema
