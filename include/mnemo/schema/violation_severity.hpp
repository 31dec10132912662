#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: violation severity.
// Escalation level of an SLO violation.
namespace mnemo::schema {

enum class violation_severity_t : uint8_t {
  warning = 0,
  critical = 1
};

inline constexpr auto kViolationSeverityMappings = std::array{
    std::pair<std::string_view, violation_severity_t>{"warning", violation_severity_t::warning},
    std::pair<std::string_view, violation_severity_t>{"critical", violation_severity_t::critical}};

template <>
inline std::optional<violation_severity_t> try_from_string<violation_severity_t>(
    const std::string_view value) {
  return from_string(value, kViolationSeverityMappings);
}

inline constexpr std::string_view to_string(const violation_severity_t value) {
  return to_string(value, kViolationSeverityMappings).value_or("unknown");
}

}  // namespace mnemo::schema
