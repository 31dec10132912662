#pragma once

#include <mnemo/schema/freshness_slo.hpp>
#include <mnemo/schema/memory_result.hpp>
#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/recall_failure.hpp>
#include <mnemo/schema/slo_compliance_status.hpp>
#include <mnemo/schema/slo_report.hpp>
#include <mnemo/schema/slo_violation.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mnemo::freshness {

struct freshness_evaluation final {
  uint64_t compliant{};
  uint64_t total{};
  double average_staleness{};
  std::vector<mnemo::schema::slo_violation_t> violations;
};

struct relevance_evaluation final {
  uint64_t compliant{};
  uint64_t total{};
  std::vector<mnemo::schema::slo_violation_t> violations;
};

/// Results that are neither flagged stale nor scored fully stale count as
/// compliant. Results without a staleness annotation fall back to
/// age_hours / max_age_hours.
freshness_evaluation evaluate_freshness(
    const std::vector<mnemo::schema::memory_result_t>& results,
    const mnemo::schema::slo_config_t& config);

/// Results whose unweighted semantic similarity reaches the relevance
/// threshold count as compliant.
relevance_evaluation evaluate_relevance(
    const std::vector<mnemo::schema::memory_result_t>& results,
    const mnemo::schema::slo_config_t& config);

mnemo::schema::slo_compliance_status_t evaluate_namespace_compliance(
    const mnemo::schema::namespace_id_t& ns,
    const std::vector<mnemo::schema::memory_result_t>& results,
    const std::vector<mnemo::schema::recall_failure_t>& failures,
    uint64_t cross_session_attempts,
    uint64_t cross_session_successes,
    const mnemo::schema::slo_config_t& config,
    mnemo::schema::timestamp_milliseconds_t now);

std::map<mnemo::schema::recall_failure_reason_t, uint64_t> aggregate_failures(
    const std::vector<mnemo::schema::recall_failure_t>& failures);

/// Roll up a period of query result sets. Every reason code is present in
/// failures_by_reason, zero when unseen.
mnemo::schema::slo_report_t generate_slo_report(
    const std::string& period_start,
    const std::string& period_end,
    const std::vector<std::vector<mnemo::schema::memory_result_t>>&
        query_results,
    const std::vector<mnemo::schema::recall_failure_t>& failures,
    uint64_t cross_session_attempts,
    uint64_t cross_session_successes,
    const std::vector<mnemo::schema::slo_compliance_status_t>&
        namespace_compliance,
    std::optional<double> average_drift_score,
    mnemo::schema::timestamp_milliseconds_t now,
    double relevance_threshold =
        mnemo::schema::freshness_slo_t{}.relevance_threshold);

/// Boxed, fixed-width summary for terminals and logs.
std::string format_slo_report(const mnemo::schema::slo_report_t& report);

}  // namespace mnemo::freshness
