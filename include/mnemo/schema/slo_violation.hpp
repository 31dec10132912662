#pragma once

#include <mnemo/schema/slo_type.hpp>
#include <mnemo/schema/violation_severity.hpp>
#include <cstdint>
#include <string>

// Schema type: SLO violation.
namespace mnemo::schema {

template <uint16_t Version>
struct slo_violation;

template <>
struct slo_violation<1> final {
  slo_type_t slo_type{slo_type_t::freshness};
  double actual_value{};
  double required_value{};
  violation_severity_t severity{violation_severity_t::warning};
  std::string description;
};

using slo_violation_t = slo_violation<1>;

}  // namespace mnemo::schema
