#include <mnemo/freshness/slo.hpp>

#include <algorithm>
#include <cctype>

#include <spdlog/fmt/fmt.h>

using namespace mnemo::schema;

namespace mnemo::freshness {

namespace {

/// Compliance below this fraction of the target is critical.
constexpr auto kCriticalFractionOfTarget = 0.8;

violation_severity_t severity_for(const double actual, const double target) {
  return actual < target * kCriticalFractionOfTarget
             ? violation_severity_t::critical
             : violation_severity_t::warning;
}

double percent(const uint64_t part, const uint64_t whole) {
  return whole == 0 ? 100.0
                    : (static_cast<double>(part) / static_cast<double>(whole)) *
                          100.0;
}

std::string upper(std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

constexpr auto kBoxWidth = std::size_t{62};
constexpr auto kRuleTop =
    "╔══════════════════════════════════════════════════════════════╗";
constexpr auto kRuleMiddle =
    "╠══════════════════════════════════════════════════════════════╣";
constexpr auto kRuleBottom =
    "╚══════════════════════════════════════════════════════════════╝";

std::string boxed(const std::string& text) {
  auto body = text.size() > kBoxWidth ? text.substr(0, kBoxWidth) : text;
  return fmt::format("║{:<{}}║", body, kBoxWidth);
}

}  // namespace

freshness_evaluation evaluate_freshness(
    const std::vector<memory_result_t>& results,
    const slo_config_t& config) {
  auto evaluation = freshness_evaluation{};
  if (results.empty()) {
    return evaluation;
  }

  const auto max_age_hours = config.freshness.max_age_hours;
  auto total_staleness = 0.0;
  for (const auto& result : results) {
    auto age_hours = result.age_days.value_or(0.0) * 24.0;
    auto staleness = result.staleness_score.value_or(age_hours / max_age_hours);
    total_staleness += std::min(1.0, staleness);
    if (!result.is_stale.value_or(false) && staleness < 1.0) {
      ++evaluation.compliant;
    }
  }
  evaluation.total = results.size();
  evaluation.average_staleness =
      total_staleness / static_cast<double>(results.size());

  auto compliance = percent(evaluation.compliant, evaluation.total);
  const auto target = config.freshness.recall_target_percent;
  if (compliance < target) {
    evaluation.violations.push_back(slo_violation_t{
        .slo_type = slo_type_t::freshness,
        .actual_value = compliance,
        .required_value = target,
        .severity = severity_for(compliance, target),
        .description = fmt::format(
            "Freshness compliance at {:.1f}%, target is {}%", compliance,
            target)});
  }
  return evaluation;
}

relevance_evaluation evaluate_relevance(
    const std::vector<memory_result_t>& results,
    const slo_config_t& config) {
  auto evaluation = relevance_evaluation{};
  if (results.empty()) {
    return evaluation;
  }

  for (const auto& result : results) {
    if (result.semantic_similarity >= config.freshness.relevance_threshold) {
      ++evaluation.compliant;
    }
  }
  evaluation.total = results.size();

  auto compliance = percent(evaluation.compliant, evaluation.total);
  const auto target = config.freshness.recall_target_percent;
  if (compliance < target) {
    evaluation.violations.push_back(slo_violation_t{
        .slo_type = slo_type_t::relevance,
        .actual_value = compliance,
        .required_value = target,
        .severity = severity_for(compliance, target),
        .description = fmt::format(
            "Relevance compliance at {:.1f}%, target is {}%", compliance,
            target)});
  }
  return evaluation;
}

slo_compliance_status_t evaluate_namespace_compliance(
    const namespace_id_t& ns,
    const std::vector<memory_result_t>& results,
    const std::vector<recall_failure_t>& failures,
    const uint64_t cross_session_attempts,
    const uint64_t cross_session_successes,
    const slo_config_t& config,
    const timestamp_milliseconds_t now) {
  auto freshness = evaluate_freshness(results, config);
  auto relevance = evaluate_relevance(results, config);

  auto status = slo_compliance_status_t{};
  status.namespace_key = make_namespace_key(ns);
  status.violations = std::move(freshness.violations);
  status.violations.insert(std::end(status.violations),
                           std::begin(relevance.violations),
                           std::end(relevance.violations));

  // Recall is tracked per result batch: any hit counts as a full recall.
  const auto target = config.freshness.recall_target_percent;
  auto recall = results.empty() ? 0.0 : 100.0;
  if (recall < target) {
    status.violations.push_back(slo_violation_t{
        .slo_type = slo_type_t::recall,
        .actual_value = recall,
        .required_value = target,
        .severity = violation_severity_t::warning,
        .description = fmt::format("Recall rate at {:.1f}%, target is {}%",
                                   recall, target)});
  }

  auto cross_session = percent(cross_session_successes, cross_session_attempts);
  if (cross_session < kCrossSessionTargetPercent) {
    status.violations.push_back(slo_violation_t{
        .slo_type = slo_type_t::cross_session,
        .actual_value = cross_session,
        .required_value = kCrossSessionTargetPercent,
        .severity = cross_session < kCrossSessionCriticalPercent
                        ? violation_severity_t::critical
                        : violation_severity_t::warning,
        .description =
            fmt::format("Cross-session recall at {:.1f}%, target is {}%",
                        cross_session, kCrossSessionTargetPercent)});
  }

  status.is_compliant = status.violations.empty();
  status.freshness_compliance_percent =
      percent(freshness.compliant, results.size());
  status.relevance_compliance_percent =
      percent(relevance.compliant, results.size());
  status.recall_compliance_percent = recall;
  status.cross_session_success_percent = cross_session;
  status.failure_count = failures.size();
  status.evaluated_at = format_timestamp(now);
  status.slo_config = config;
  return status;
}

std::map<recall_failure_reason_t, uint64_t> aggregate_failures(
    const std::vector<recall_failure_t>& failures) {
  auto counts = std::map<recall_failure_reason_t, uint64_t>{};
  for (const auto& failure : failures) {
    ++counts[failure.reason];
  }
  return counts;
}

slo_report_t generate_slo_report(
    const std::string& period_start,
    const std::string& period_end,
    const std::vector<std::vector<memory_result_t>>& query_results,
    const std::vector<recall_failure_t>& failures,
    const uint64_t cross_session_attempts,
    const uint64_t cross_session_successes,
    const std::vector<slo_compliance_status_t>& namespace_compliance,
    const std::optional<double> average_drift_score,
    const timestamp_milliseconds_t now,
    const double relevance_threshold) {
  auto report = slo_report_t{};
  report.report_id = fmt::format("slo_{}_{}", now, make_uuid().substr(0, 6));
  report.period_start = period_start;
  report.period_end = period_end;
  for (const auto& [name, reason] : kRecallFailureReasonMappings) {
    report.failures_by_reason[reason] = 0;
  }

  auto total_staleness = 0.0;
  auto result_count = uint64_t{};
  for (const auto& results : query_results) {
    ++report.total_queries;
    auto has_fresh = false;
    auto has_relevant = false;
    for (const auto& result : results) {
      ++result_count;
      total_staleness += result.staleness_score.value_or(0.0);
      if (!result.is_stale.value_or(false)) {
        has_fresh = true;
      }
      if (result.semantic_similarity >= relevance_threshold) {
        has_relevant = true;
      }
    }
    if (has_fresh) {
      ++report.fresh_queries;
    }
    if (has_relevant) {
      ++report.relevant_queries;
    }
    if (!results.empty()) {
      ++report.successful_recalls;
    }
  }

  report.cross_session_attempts = cross_session_attempts;
  report.cross_session_successes = cross_session_successes;
  report.total_failures = failures.size();
  for (const auto& [reason, count] : aggregate_failures(failures)) {
    report.failures_by_reason[reason] = count;
  }
  report.avg_staleness_score =
      result_count > 0 ? total_staleness / static_cast<double>(result_count)
                       : 0.0;
  report.avg_drift_score = average_drift_score;
  report.namespace_compliance = namespace_compliance;
  report.generated_at = format_timestamp(now);
  return report;
}

std::string format_slo_report(const slo_report_t& report) {
  auto lines = std::vector<std::string>{};
  auto rate = [&report](const uint64_t part) {
    return report.total_queries == 0
               ? 100.0
               : (static_cast<double>(part) /
                  static_cast<double>(report.total_queries)) *
                     100.0;
  };

  lines.emplace_back(kRuleTop);
  lines.push_back(boxed(fmt::format("{:^{}}", "SLO COMPLIANCE REPORT", kBoxWidth)));
  lines.emplace_back(kRuleMiddle);
  lines.push_back(boxed(fmt::format(" Period: {} to {}",
                                    report.period_start.substr(0, 10),
                                    report.period_end.substr(0, 10))));
  lines.emplace_back(kRuleMiddle);
  lines.push_back(
      boxed(fmt::format(" Total Queries:        {:>8}", report.total_queries)));
  lines.push_back(boxed(
      fmt::format(" Freshness Rate:       {:>7.1f}%", rate(report.fresh_queries))));
  lines.push_back(boxed(fmt::format(" Relevance Rate:       {:>7.1f}%",
                                    rate(report.relevant_queries))));
  lines.push_back(boxed(fmt::format(" Recall Success:       {:>7.1f}%",
                                    rate(report.successful_recalls))));
  lines.push_back(boxed(fmt::format(
      " Cross-Session:        {:>7.1f}%",
      report.cross_session_attempts == 0
          ? 100.0
          : (static_cast<double>(report.cross_session_successes) /
             static_cast<double>(report.cross_session_attempts)) *
                100.0)));
  lines.push_back(boxed(
      fmt::format(" Avg Staleness:        {:>8.3f}", report.avg_staleness_score)));
  if (report.avg_drift_score) {
    lines.push_back(boxed(
        fmt::format(" Avg Drift:            {:>8.3f}", *report.avg_drift_score)));
  }
  lines.emplace_back(kRuleMiddle);

  if (report.total_failures > 0) {
    lines.push_back(boxed(fmt::format(" FAILURES: {}", report.total_failures)));
    for (const auto& [reason, count] : report.failures_by_reason) {
      if (count > 0) {
        lines.push_back(
            boxed(fmt::format("   {:<30} {:>5}", to_string(reason), count)));
      }
    }
    lines.emplace_back(kRuleMiddle);
  }

  if (!report.namespace_compliance.empty()) {
    lines.push_back(boxed(" NAMESPACE COMPLIANCE"));
    for (const auto& ns : report.namespace_compliance) {
      lines.push_back(boxed(fmt::format(
          " {} {:<40} {:>3.0f}% fresh", ns.is_compliant ? "OK" : "!!",
          ns.namespace_key.substr(0, 40), ns.freshness_compliance_percent)));
      for (const auto& violation : ns.violations) {
        lines.push_back(boxed(fmt::format("   - [{}] {}",
                                          upper(to_string(violation.severity)),
                                          violation.description.substr(0, 45))));
      }
    }
  }
  lines.emplace_back(kRuleBottom);

  auto out = std::string{};
  for (const auto& line : lines) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out.append(line);
  }
  return out;
}

}  // namespace mnemo::freshness
