#include <mnemo/config/options.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <boost/regex.hpp>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace po = boost::program_options;

namespace mnemo::config {

namespace {

po::options_description make_description(engine_options& options,
                                         double& default_ttl_days) {
  auto description = po::options_description{"mnemo engine"};
  auto& weights = options.ranking_weights;
  auto& slo = options.slo;
  auto& drift = options.drift;
  auto& ttl = options.ttl;
  description.add_options()(
      "ranking.task_criticality",
      po::value<double>(&weights.task_criticality)
          ->default_value(weights.task_criticality))(
      "ranking.semantic_similarity",
      po::value<double>(&weights.semantic_similarity)
          ->default_value(weights.semantic_similarity))(
      "ranking.importance",
      po::value<double>(&weights.importance)
          ->default_value(weights.importance))(
      "ranking.recency_decay",
      po::value<double>(&weights.recency_decay)
          ->default_value(weights.recency_decay))(
      "slo.max_age_hours",
      po::value<double>(&slo.freshness.max_age_hours)
          ->default_value(slo.freshness.max_age_hours))(
      "slo.relevance_threshold",
      po::value<double>(&slo.freshness.relevance_threshold)
          ->default_value(slo.freshness.relevance_threshold))(
      "slo.recall_target_percent",
      po::value<double>(&slo.freshness.recall_target_percent)
          ->default_value(slo.freshness.recall_target_percent))(
      "slo.enabled", po::value<bool>(&slo.enabled)->default_value(slo.enabled))(
      "slo.alert_threshold_percent",
      po::value<double>(&slo.alert_threshold_percent)
          ->default_value(slo.alert_threshold_percent))(
      "slo.evaluation_interval_minutes",
      po::value<uint32_t>(&slo.evaluation_interval_minutes)
          ->default_value(slo.evaluation_interval_minutes))(
      "drift.max_drift_score",
      po::value<double>(&drift.max_drift_score)
          ->default_value(drift.max_drift_score))(
      "drift.min_coherence_score",
      po::value<double>(&drift.min_coherence_score)
          ->default_value(drift.min_coherence_score))(
      "drift.max_fragmentation_score",
      po::value<double>(&drift.max_fragmentation_score)
          ->default_value(drift.max_fragmentation_score))(
      "validation.max_entry_length",
      po::value<std::size_t>(&options.validation.max_entry_length)
          ->default_value(options.validation.max_entry_length))(
      "validation.quarantine_threshold",
      po::value<double>(&options.validation.quarantine_threshold)
          ->default_value(options.validation.quarantine_threshold))(
      "ttl.enabled", po::value<bool>(&ttl.enabled)->default_value(ttl.enabled))(
      "ttl.default_ttl_days", po::value<double>(&default_ttl_days))(
      "ttl.decay_enabled",
      po::value<bool>(&ttl.decay_enabled)->default_value(ttl.decay_enabled))(
      "expire.batch_size",
      po::value<uint64_t>(&options.expire_batch_size)
          ->default_value(options.expire_batch_size));
  return description;
}

}  // namespace

engine_options load_options(std::istream& input) {
  auto options = engine_options{};
  auto default_ttl_days = 0.0;
  auto description = make_description(options, default_ttl_days);
  auto vm = po::variables_map{};
  po::store(po::parse_config_file(input, description), vm);
  po::notify(vm);
  if (vm.contains("ttl.default_ttl_days")) {
    options.ttl.default_ttl_days = default_ttl_days;
  }
  return options;
}

engine_options load_options(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    throw std::runtime_error{fmt::format("cannot open config file '{}'", path)};
  }
  spdlog::info("Loading engine options from '{}'", path);
  return load_options(input);
}

std::vector<std::string> validate_options(const engine_options& options) {
  auto violations = std::vector<std::string>{};
  const auto& weights = options.ranking_weights;
  if (weights.task_criticality < 0 || weights.semantic_similarity < 0 ||
      weights.importance < 0 || weights.recency_decay < 0) {
    violations.emplace_back("ranking weights must be non-negative");
  }
  const auto& slo = options.slo;
  if (slo.freshness.max_age_hours <= 0) {
    violations.emplace_back("slo.max_age_hours must be positive");
  }
  if (slo.freshness.relevance_threshold < 0 ||
      slo.freshness.relevance_threshold > 1) {
    violations.emplace_back("slo.relevance_threshold must be within [0, 1]");
  }
  if (slo.freshness.recall_target_percent < 0 ||
      slo.freshness.recall_target_percent > 100) {
    violations.emplace_back("slo.recall_target_percent must be within [0, 100]");
  }
  if (slo.alert_threshold_percent < 0 || slo.alert_threshold_percent > 100) {
    violations.emplace_back(
        "slo.alert_threshold_percent must be within [0, 100]");
  }
  if (slo.evaluation_interval_minutes == 0) {
    violations.emplace_back("slo.evaluation_interval_minutes must be positive");
  }
  if (options.ttl.default_ttl_days && *options.ttl.default_ttl_days < 0) {
    violations.emplace_back("ttl.default_ttl_days must be non-negative");
  }
  if (options.expire_batch_size == 0) {
    violations.emplace_back("expire.batch_size must be positive");
  }
  return violations;
}

std::optional<double> parse_duration(const std::string_view value) {
  static const auto pattern =
      boost::regex{R"(^\s*(\d+(?:\.\d+)?)\s*([hdwHDW])\s*$)"};
  auto match = boost::match_results<std::string_view::const_iterator>{};
  if (!boost::regex_match(std::begin(value), std::end(value), match, pattern)) {
    return std::nullopt;
  }
  auto amount = std::stod(match[1].str());
  switch (std::tolower(static_cast<unsigned char>(*match[2].first))) {
    case 'h':
      return amount;
    case 'd':
      return amount * 24;
    case 'w':
      return amount * 24 * 7;
    default:
      return std::nullopt;
  }
}

std::string format_duration(const uint64_t hours) {
  if (hours < 24) {
    return fmt::format("{}h", hours);
  }
  auto days = hours / 24;
  auto remainder = hours % 24;
  if (remainder == 0) {
    return fmt::format("{}d", days);
  }
  return fmt::format("{}d {}h", days, remainder);
}

}  // namespace mnemo::config
