#pragma once

#include <mnemo/schema/freshness_slo.hpp>
#include <mnemo/schema/slo_violation.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: SLO compliance status.
// Namespace-level compliance snapshot; compliant iff no violations.
namespace mnemo::schema {

template <uint16_t Version>
struct slo_compliance_status;

template <>
struct slo_compliance_status<1> final {
  std::string namespace_key;
  bool is_compliant{true};
  double freshness_compliance_percent{100.0};
  double relevance_compliance_percent{100.0};
  double recall_compliance_percent{100.0};
  double cross_session_success_percent{100.0};
  uint64_t failure_count{};
  std::string evaluated_at;
  slo_config_t slo_config;
  std::vector<slo_violation_t> violations;
};

using slo_compliance_status_t = slo_compliance_status<1>;

}  // namespace mnemo::schema
