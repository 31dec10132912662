#pragma once

#include <mnemo/schema/drift_thresholds.hpp>
#include <mnemo/schema/freshness_slo.hpp>
#include <mnemo/schema/ranking_weights.hpp>
#include <mnemo/schema/ttl_policy.hpp>
#include <mnemo/schema/validation_config.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::config {

/// Tunables of the lifecycle manager and its evaluators.
struct engine_options final {
  mnemo::schema::ranking_weights_t ranking_weights;
  mnemo::schema::slo_config_t slo;
  mnemo::schema::drift_thresholds_t drift;
  mnemo::schema::validation_config_t validation;
  mnemo::schema::ttl_policy_t ttl;
  /// Memories scanned per page during an expiry sweep.
  uint64_t expire_batch_size{500};
};

/// Read `section.key = value` pairs. Unknown keys are rejected by
/// Boost.Program_options; missing keys keep their defaults.
engine_options load_options(std::istream& input);
engine_options load_options(const std::string& path);

/// Constraint violations, empty when the options are usable.
std::vector<std::string> validate_options(const engine_options& options);

/// `24h`, `1.5d` or `2w` as hours, case-insensitive; nullopt when malformed.
std::optional<double> parse_duration(std::string_view value);

/// Whole hours as `5h`, `3d` or `3d 4h`.
std::string format_duration(uint64_t hours);

}  // namespace mnemo::config
