#include <mnemo/drift/drift.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <set>
#include <string>

using namespace mnemo::schema;

namespace mnemo::drift {

namespace {

timestamp_milliseconds_t sort_key(const memory_object_t& memory) {
  return try_parse_timestamp(memory.created_at)
      .value_or(std::numeric_limits<timestamp_milliseconds_t>::min());
}

bool shares_tag(const memory_object_t& lhs, const memory_object_t& rhs) {
  return std::any_of(std::begin(lhs.tags), std::end(lhs.tags),
                     [&rhs](const auto& tag) {
                       return std::find(std::begin(rhs.tags),
                                        std::end(rhs.tags),
                                        tag) != std::end(rhs.tags);
                     });
}

}  // namespace

double tag_similarity(const tag_list_t& lhs, const tag_list_t& rhs) {
  auto lhs_set = std::set<std::string>{std::begin(lhs), std::end(lhs)};
  auto rhs_set = std::set<std::string>{std::begin(rhs), std::end(rhs)};
  auto union_set = lhs_set;
  union_set.insert(std::begin(rhs_set), std::end(rhs_set));
  if (union_set.empty()) {
    return 1.0;
  }
  auto intersection = std::size_t{};
  for (const auto& tag : lhs_set) {
    if (rhs_set.contains(tag)) {
      ++intersection;
    }
  }
  return static_cast<double>(intersection) /
         static_cast<double>(union_set.size());
}

drift_metrics_t calculate_drift_metrics(
    const std::vector<memory_object_t>& memories,
    const timestamp_milliseconds_t now,
    const drift_thresholds_t& thresholds) {
  auto metrics = drift_metrics_t{};
  metrics.last_checked_at = format_timestamp(now);
  if (memories.empty()) {
    return metrics;
  }

  auto sorted = memories;
  std::stable_sort(std::begin(sorted), std::end(sorted),
                   [](const auto& lhs, const auto& rhs) {
                     return sort_key(lhs) < sort_key(rhs);
                   });

  for (auto i = std::size_t{1}; i < sorted.size(); ++i) {
    if (tag_similarity(sorted[i - 1].tags, sorted[i].tags) <
        kTopicChangeSimilarity) {
      ++metrics.topic_changes;
    }
  }

  auto isolated = std::size_t{};
  for (auto i = std::size_t{}; i < memories.size(); ++i) {
    if (memories[i].tags.empty()) {
      continue;
    }
    auto shared = false;
    for (auto j = std::size_t{}; j < memories.size() && !shared; ++j) {
      shared = i != j && memories[j].memory_id != memories[i].memory_id &&
               shares_tag(memories[i], memories[j]);
    }
    if (!shared) {
      ++isolated;
    }
  }
  metrics.fragmentation_score =
      memories.size() > 1 ? static_cast<double>(isolated) /
                                static_cast<double>(memories.size())
                          : 0.0;

  auto tag_counts = std::map<std::string, std::size_t>{};
  for (const auto& memory : memories) {
    for (const auto& tag : memory.tags) {
      ++tag_counts[tag];
    }
  }
  auto average_tag_frequency = 0.0;
  if (!tag_counts.empty()) {
    auto occurrences = std::size_t{};
    for (const auto& [tag, count] : tag_counts) {
      occurrences += count;
    }
    average_tag_frequency = static_cast<double>(occurrences) /
                            static_cast<double>(tag_counts.size()) /
                            static_cast<double>(memories.size());
  }
  metrics.coherence_score = std::min(1.0, average_tag_frequency * 2.0);

  auto topic_change_rate =
      sorted.size() > 1 ? static_cast<double>(metrics.topic_changes) /
                              static_cast<double>(sorted.size() - 1)
                        : 0.0;
  metrics.drift_score = std::min(
      1.0, topic_change_rate * kTopicChangeWeight +
               metrics.fragmentation_score * kFragmentationWeight +
               (1.0 - metrics.coherence_score) * kIncoherenceWeight);

  metrics.drift_detected =
      metrics.drift_score > thresholds.max_drift_score ||
      metrics.coherence_score < thresholds.min_coherence_score ||
      metrics.fragmentation_score > thresholds.max_fragmentation_score;
  return metrics;
}

}  // namespace mnemo::drift
