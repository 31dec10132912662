#pragma once

#include <cstdint>
#include <optional>

// Schema type: TTL policy.
// Automatic expiry applied at creation time and during expiry sweeps.
namespace mnemo::schema {

template <uint16_t Version>
struct ttl_policy;

template <>
struct ttl_policy<1> final {
  bool enabled{};
  /// Absent: memories are permanent unless the caller sets a TTL.
  std::optional<double> default_ttl_days;
  /// Also expire memories whose staleness exceeds the freshness SLO.
  bool decay_enabled{};
};

using ttl_policy_t = ttl_policy<1>;

}  // namespace mnemo::schema
