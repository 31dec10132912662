#include <gtest/gtest.h>
#include <mnemo/lifecycle/manager.hpp>
#include <mnemo/storage/rocksdb/store.hpp>
#include <mnemo/testing/common.hpp>

#include <string>
#include <vector>

using namespace mnemo::schema;
using namespace mnemo::storage;
using mnemo::testing::kBaseTime;
using mnemo::testing::make_db_path;
using mnemo::testing::make_memory;
using mnemo::testing::make_namespace;
using mnemo::testing::remove_path;

namespace {

using store_t = store<rocksdb_store_tag>;

audit_entry_t make_audit(const std::string& resource,
                         const timestamp_milliseconds_t at,
                         const namespace_id_t& ns = make_namespace()) {
  auto entry = audit_entry_t{};
  entry.id = make_uuid();
  entry.ns = ns;
  entry.action = audit_action_t::update;
  entry.resource_id = resource;
  entry.actor_id = "tester";
  entry.timestamp = format_timestamp(at);
  return entry;
}

}  // namespace

TEST(rocksdb_store, memories_survive_reopen) {
  auto path = make_db_path("mnemo_rocksdb_reopen");
  {
    auto db = make_store<rocksdb_store_tag>(path);
    auto memory = make_memory("m1", kBaseTime, {"prefs"});
    memory.embedding = embedding_t{0.5, 0.25};
    db.save_memory(memory);
    db.save_quarantined(make_memory("q1", kBaseTime));
  }
  {
    auto db = make_store<rocksdb_store_tag>(path);
    auto loaded = db.get_memory("m1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->content, "content of m1");
    EXPECT_EQ(loaded->tags, (tag_list_t{"prefs"}));
    EXPECT_EQ(loaded->embedding, (embedding_t{0.5, 0.25}));
    EXPECT_TRUE(db.get_quarantined("q1").has_value());
    EXPECT_FALSE(db.get_memory("q1").has_value());
  }
  remove_path(path);
}

TEST(rocksdb_store, remove_and_delete_quarantined) {
  auto path = make_db_path("mnemo_rocksdb_remove");
  {
    auto db = make_store<rocksdb_store_tag>(path);
    db.save_memory(make_memory("m1", kBaseTime));
    db.save_quarantined(make_memory("m1", kBaseTime));

    db.remove_memory("m1");
    EXPECT_FALSE(db.get_memory("m1").has_value());
    EXPECT_EQ(db.get_memory_audit_log("m1").size(), 1u);

    db.delete_quarantined("m1");
    EXPECT_FALSE(db.get_quarantined("m1").has_value());
    EXPECT_TRUE(db.get_memory_audit_log("m1").empty());

    db.remove_memory("never-stored");
  }
  remove_path(path);
}

TEST(rocksdb_store, list_matches_memory_store_semantics) {
  auto path = make_db_path("mnemo_rocksdb_list");
  {
    auto db = make_store<rocksdb_store_tag>(path);
    for (auto i = 0; i < 4; ++i) {
      db.save_memory(make_memory("m" + std::to_string(i), kBaseTime + i * 1000));
    }
    auto deleted = make_memory("deleted", kBaseTime + 9000);
    deleted.status = memory_status_t::deleted;
    db.save_memory(deleted);
    db.save_memory(
        make_memory("foreign", kBaseTime, {}, make_namespace("agent-2")));

    auto options = list_memory_options_t{};
    options.limit = 2;
    auto newest = db.list_memories(make_namespace(), options, kBaseTime);
    ASSERT_EQ(newest.size(), 2u);
    EXPECT_EQ(newest[0].memory_id, "m3");
    EXPECT_EQ(newest[1].memory_id, "m2");

    options.limit.reset();
    options.order = list_order_t::asc;
    EXPECT_EQ(db.list_memories(make_namespace(), options, kBaseTime).size(), 4u);
  }
  remove_path(path);
}

TEST(rocksdb_store, search_ranks_active_memories) {
  auto path = make_db_path("mnemo_rocksdb_search");
  {
    auto db = make_store<rocksdb_store_tag>(path);
    auto low = make_memory("low", kBaseTime, {"work"});
    low.importance = 0.1;
    auto high = make_memory("high", kBaseTime, {"work"});
    high.importance = 0.9;
    db.save_memory(low);
    db.save_memory(high);
    db.save_memory(make_memory("other", kBaseTime, {"home"}));

    auto query = memory_query_t{};
    query.ns = make_namespace();
    query.tags = tag_list_t{"work"};
    auto results = db.search_memories(query, kBaseTime);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].memory_id, "high");
    EXPECT_EQ(results[1].memory_id, "low");
  }
  remove_path(path);
}

TEST(rocksdb_store, audit_log_is_scoped_by_namespace) {
  auto path = make_db_path("mnemo_rocksdb_audit");
  {
    auto db = make_store<rocksdb_store_tag>(path);
    EXPECT_TRUE(db.log_audit(make_audit("r1", kBaseTime)));
    EXPECT_TRUE(db.log_audit(make_audit("r2", kBaseTime + 1000)));
    EXPECT_TRUE(
        db.log_audit(make_audit("other", kBaseTime, make_namespace("agent-2"))));

    auto entries = db.get_audit_log(make_namespace(), {});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].resource_id, "r2");
    EXPECT_EQ(entries[1].resource_id, "r1");
    EXPECT_EQ(entries[0].action, audit_action_t::update);

    EXPECT_EQ(db.get_audit_log(make_namespace("agent-2"), {}).size(), 1u);
    EXPECT_TRUE(db.get_audit_log(make_namespace("agent-3"), {}).empty());
  }
  remove_path(path);
}

TEST(rocksdb_store, lifecycle_state_persists) {
  auto path = make_db_path("mnemo_rocksdb_lifecycle");
  auto clock = mnemo::testing::manual_clock{kBaseTime};
  auto memory_id = memory_id_t{};
  {
    auto db = make_store<rocksdb_store_tag>(path);
    auto manager = mnemo::lifecycle::manager<rocksdb_store_tag>{
        db, {}, mnemo::testing::accepting_validator(), clock.function()};

    auto input = create_memory_t{};
    input.ns = make_namespace();
    input.content = "User prefers tea";
    input.source_identifier = "user-1";
    auto created = manager.create_memory(input);
    ASSERT_EQ(created.code, 0u);
    memory_id = created.memory->memory_id;

    auto updates = edit_memory_t{};
    updates.content = "User prefers green tea";
    ASSERT_EQ(manager.edit_memory(memory_id, updates, "editor").code, 0u);
    ASSERT_EQ(manager.quarantine_memory(memory_id, "moderator", "review").code,
              0u);
  }
  {
    auto db = make_store<rocksdb_store_tag>(path);
    EXPECT_FALSE(db.get_memory(memory_id).has_value());
    auto stored = db.get_quarantined(memory_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->content, "User prefers green tea");
    EXPECT_EQ(stored->version, 2u);
    EXPECT_EQ(stored->status, memory_status_t::quarantined);
    ASSERT_EQ(stored->previous_versions.size(), 1u);
    EXPECT_EQ(stored->previous_versions[0].content, "User prefers tea");
    EXPECT_EQ(db.get_memory_audit_log(memory_id).size(), 3u);
    EXPECT_FALSE(db.get_audit_log(make_namespace(), {}).empty());
  }
  remove_path(path);
}
