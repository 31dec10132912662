#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit action.
// Coarse action class written to the audit log.
namespace mnemo::schema {

enum class audit_action_t : uint8_t {
  create = 0,
  read = 1,
  restore = 2,
  search = 3,
  remove = 4,
  update = 5
};

inline constexpr auto kAuditActionMappings = std::array{
    std::pair<std::string_view, audit_action_t>{"create", audit_action_t::create},
    std::pair<std::string_view, audit_action_t>{"read", audit_action_t::read},
    std::pair<std::string_view, audit_action_t>{"restore", audit_action_t::restore},
    std::pair<std::string_view, audit_action_t>{"search", audit_action_t::search},
    std::pair<std::string_view, audit_action_t>{"delete", audit_action_t::remove},
    std::pair<std::string_view, audit_action_t>{"update", audit_action_t::update}};

template <>
inline std::optional<audit_action_t> try_from_string<audit_action_t>(
    const std::string_view value) {
  return from_string(value, kAuditActionMappings);
}

inline constexpr std::string_view to_string(const audit_action_t value) {
  return to_string(value, kAuditActionMappings).value_or("unknown");
}

}  // namespace mnemo::schema
