#include <gtest/gtest.h>
#include <mnemo/drift/drift.hpp>
#include <mnemo/testing/common.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace mnemo::schema;
using namespace mnemo::drift;
using mnemo::testing::kBaseTime;
using mnemo::testing::make_memory;

namespace {

std::vector<memory_object_t> sequence(const std::vector<tag_list_t>& tags) {
  auto memories = std::vector<memory_object_t>{};
  for (auto i = std::size_t{}; i < tags.size(); ++i) {
    memories.push_back(make_memory(
        "m" + std::to_string(i),
        kBaseTime + static_cast<timestamp_milliseconds_t>(i) * 60000, tags[i]));
  }
  return memories;
}

}  // namespace

TEST(drift, tag_similarity_is_jaccard) {
  EXPECT_DOUBLE_EQ(tag_similarity({"a", "b"}, {"b", "c"}), 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(tag_similarity({"a"}, {"a", "a"}), 1.0);
  EXPECT_DOUBLE_EQ(tag_similarity({}, {}), 1.0);
  EXPECT_DOUBLE_EQ(tag_similarity({"a"}, {}), 0.0);
}

TEST(drift, empty_session_has_no_drift) {
  auto metrics = calculate_drift_metrics({}, kBaseTime);
  EXPECT_DOUBLE_EQ(metrics.drift_score, 0.0);
  EXPECT_DOUBLE_EQ(metrics.coherence_score, 1.0);
  EXPECT_DOUBLE_EQ(metrics.fragmentation_score, 0.0);
  EXPECT_EQ(metrics.topic_changes, 0u);
  EXPECT_FALSE(metrics.drift_detected);
  EXPECT_EQ(metrics.last_checked_at, "2026-01-15T00:00:00.000Z");
}

TEST(drift, focused_session_is_coherent) {
  auto metrics = calculate_drift_metrics(
      sequence({{"billing"}, {"billing"}, {"billing"}}), kBaseTime);
  EXPECT_EQ(metrics.topic_changes, 0u);
  EXPECT_DOUBLE_EQ(metrics.fragmentation_score, 0.0);
  EXPECT_DOUBLE_EQ(metrics.coherence_score, 1.0);
  EXPECT_DOUBLE_EQ(metrics.drift_score, 0.0);
  EXPECT_FALSE(metrics.drift_detected);
}

TEST(drift, wandering_session_is_detected) {
  auto metrics = calculate_drift_metrics(
      sequence({{"a", "b"}, {"c", "d"}, {"e", "f"}}), kBaseTime);

  EXPECT_EQ(metrics.topic_changes, 2u);
  EXPECT_DOUBLE_EQ(metrics.fragmentation_score, 1.0);
  EXPECT_NEAR(metrics.coherence_score, 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(metrics.drift_score, 0.8, 1e-12);
  EXPECT_TRUE(metrics.drift_detected);
}

TEST(drift, partial_overlap_is_not_a_topic_change) {
  auto metrics = calculate_drift_metrics(
      sequence({{"a", "b"}, {"b", "c"}, {"x", "y"}, {"z"}}), kBaseTime);
  EXPECT_EQ(metrics.topic_changes, 2u);
  EXPECT_DOUBLE_EQ(metrics.fragmentation_score, 0.5);
}

TEST(drift, input_order_does_not_matter) {
  auto memories = sequence({{"a"}, {"b"}, {"a"}, {"b"}});
  auto forward = calculate_drift_metrics(memories, kBaseTime);
  std::reverse(std::begin(memories), std::end(memories));
  auto reversed = calculate_drift_metrics(memories, kBaseTime);
  EXPECT_EQ(forward.topic_changes, reversed.topic_changes);
  EXPECT_DOUBLE_EQ(forward.drift_score, reversed.drift_score);
}

TEST(drift, thresholds_decide_detection) {
  auto memories = sequence({{"a", "b", "c"}, {"a", "d", "e"}});
  auto metrics = calculate_drift_metrics(memories, kBaseTime);
  EXPECT_EQ(metrics.topic_changes, 1u);
  EXPECT_DOUBLE_EQ(metrics.drift_score, 0.4);
  EXPECT_FALSE(metrics.drift_detected);

  auto strict = drift_thresholds_t{};
  strict.max_drift_score = 0.3;
  EXPECT_TRUE(calculate_drift_metrics(memories, kBaseTime, strict).drift_detected);
}

TEST(drift, scores_stay_in_unit_range) {
  auto metrics = calculate_drift_metrics(
      sequence({{"a"}, {"b"}, {"c"}, {"d"}, {"e"}, {"f"}}), kBaseTime);
  EXPECT_GE(metrics.drift_score, 0.0);
  EXPECT_LE(metrics.drift_score, 1.0);
  EXPECT_GE(metrics.coherence_score, 0.0);
  EXPECT_LE(metrics.coherence_score, 1.0);
  EXPECT_DOUBLE_EQ(metrics.fragmentation_score, 1.0);
}
