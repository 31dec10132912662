#pragma once

#include <mnemo/schema/recall_failure_reason.hpp>
#include <mnemo/schema/slo_compliance_status.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Schema type: SLO report.
// Periodic roll-up of query outcomes, failures and namespace compliance.
namespace mnemo::schema {

template <uint16_t Version>
struct slo_report;

template <>
struct slo_report<1> final {
  std::string report_id;
  std::string period_start;
  std::string period_end;
  uint64_t total_queries{};
  uint64_t fresh_queries{};
  uint64_t relevant_queries{};
  uint64_t successful_recalls{};
  uint64_t cross_session_attempts{};
  uint64_t cross_session_successes{};
  uint64_t total_failures{};
  std::map<recall_failure_reason_t, uint64_t> failures_by_reason;
  double avg_staleness_score{};
  std::optional<double> avg_drift_score;
  std::vector<slo_compliance_status_t> namespace_compliance;
  std::string generated_at;
};

using slo_report_t = slo_report<1>;

}  // namespace mnemo::schema
