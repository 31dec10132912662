#include <gtest/gtest.h>
#include <mnemo/session/session.hpp>
#include <mnemo/testing/common.hpp>

#include <vector>

using namespace mnemo::schema;
using namespace mnemo::session;
using mnemo::testing::kBaseTime;
using mnemo::testing::make_memory;
using mnemo::testing::make_namespace;

namespace {

memory_object_t in_session(const std::string& id,
                           const timestamp_milliseconds_t created_at,
                           std::optional<std::string> session_id) {
  auto memory = make_memory(id, created_at);
  memory.session_id = std::move(session_id);
  return memory;
}

}  // namespace

TEST(session, group_by_session_orders_newest_first) {
  auto hour = kMillisecondsPerHour;
  auto memories = std::vector<memory_object_t>{
      in_session("m1", kBaseTime + hour, "s1"),
      in_session("m2", kBaseTime, "s1"),
      in_session("m3", kBaseTime + 3 * hour, "s2"),
      in_session("m4", kBaseTime + 2 * hour, std::nullopt)};
  memories[0].cross_session_recall_count = 2;
  memories[1].cross_session_recall_count = 1;

  auto sessions = group_by_session(make_namespace(), memories);
  ASSERT_EQ(sessions.size(), 3u);
  EXPECT_EQ(sessions[0].session_id, "s2");
  EXPECT_EQ(sessions[1].session_id, std::string{kDefaultSessionId});
  EXPECT_EQ(sessions[2].session_id, "s1");

  const auto& s1 = sessions[2];
  EXPECT_EQ(s1.namespace_key, "acme:assistant:agent-1");
  EXPECT_EQ(s1.memory_count, 2u);
  EXPECT_EQ(s1.memory_ids, (std::vector<memory_id_t>{"m1", "m2"}));
  EXPECT_EQ(s1.started_at, format_timestamp(kBaseTime));
  EXPECT_EQ(s1.cross_session_recalls, 3u);
  EXPECT_FALSE(s1.ended_at.has_value());
}

TEST(session, group_by_session_of_nothing_is_empty) {
  EXPECT_TRUE(group_by_session(make_namespace(), {}).empty());
}

TEST(session, filter_by_session_matches_origin_only) {
  auto memories = std::vector<memory_object_t>{
      in_session("m1", kBaseTime, "s1"), in_session("m2", kBaseTime, "s2"),
      in_session("m3", kBaseTime, std::nullopt)};
  memories[1].accessed_in_sessions.push_back("s1");

  auto filtered = filter_by_session(memories, "s1");
  ASSERT_EQ(filtered.size(), 1u);
  EXPECT_EQ(filtered[0].memory_id, "m1");
  EXPECT_TRUE(filter_by_session(memories, "s9").empty());
}

TEST(session, cross_session_access_is_counted_once) {
  auto memory = in_session("m1", kBaseTime, "origin");
  EXPECT_FALSE(is_new_cross_session_access(memory, "origin"));
  EXPECT_FALSE(is_new_cross_session_access(memory, ""));
  EXPECT_TRUE(is_new_cross_session_access(memory, "other"));

  memory.accessed_in_sessions.push_back("other");
  EXPECT_FALSE(is_new_cross_session_access(memory, "other"));

  auto orphan = in_session("m2", kBaseTime, std::nullopt);
  EXPECT_TRUE(is_new_cross_session_access(orphan, "any"));
}

TEST(session, registry_tracks_sessions_per_namespace) {
  auto registry = session_registry{};
  auto entry = session_history_entry_t{};
  entry.session_id = "s1";
  entry.namespace_key = "acme:assistant:agent-1";
  entry.started_at = format_timestamp(kBaseTime);
  registry.record_session(entry);

  auto other = entry;
  other.namespace_key = "acme:assistant:agent-2";
  registry.record_session(other);

  EXPECT_TRUE(registry.end_session("acme:assistant:agent-1", "s1",
                                   "2026-01-15T01:00:00.000Z"));
  EXPECT_FALSE(registry.end_session("acme:assistant:agent-1", "s9", "x"));
  EXPECT_FALSE(registry.end_session("unknown", "s1", "x"));

  auto history = registry.history("acme:assistant:agent-1");
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].ended_at, "2026-01-15T01:00:00.000Z");

  auto untouched = registry.history("acme:assistant:agent-2");
  ASSERT_EQ(untouched.size(), 1u);
  EXPECT_FALSE(untouched[0].ended_at.has_value());
  EXPECT_TRUE(registry.history("nobody").empty());
}
