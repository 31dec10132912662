#include <mnemo/lifecycle/manager.hpp>
#include <mnemo/testing/lifecycle_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace mnemo::schema;

namespace {

using mnemo::testing::faulty_lifecycle_fixture;
using mnemo::testing::lifecycle_fixture;

uint32_t code_of(const lifecycle_error_code code) {
  return static_cast<uint32_t>(code);
}

void expect_versions_below_current(const memory_object_t& memory) {
  for (const auto& snapshot : memory.previous_versions) {
    EXPECT_LT(snapshot.version, memory.version);
  }
}

}  // namespace

TEST(lifecycle_manager, create_starts_at_version_one_with_created_entry) {
  auto fixture = lifecycle_fixture{};
  auto result = fixture.manager().create_memory(
      fixture.input("User prefers dark mode", {"ui", "preferences"}));

  ASSERT_EQ(result.code, 0u);
  ASSERT_TRUE(result.memory.has_value());
  const auto& memory = *result.memory;
  EXPECT_FALSE(memory.memory_id.empty());
  EXPECT_EQ(memory.version, 1u);
  EXPECT_EQ(memory.status, memory_status_t::active);
  EXPECT_TRUE(memory.previous_versions.empty());
  ASSERT_EQ(memory.provenance.size(), 1u);
  EXPECT_EQ(memory.provenance[0].action, provenance_action_t::created);
  EXPECT_EQ(memory.provenance[0].reason, "Created from user_input");
  EXPECT_EQ(memory.created_at, "2026-01-15T00:00:00.000Z");
  EXPECT_EQ(memory.source.timestamp, memory.created_at);
  EXPECT_DOUBLE_EQ(memory.importance, 0.5);
  EXPECT_DOUBLE_EQ(memory.task_criticality, 0.5);

  auto stored = fixture.store().get_memory(memory.memory_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->content, "User prefers dark mode");
  EXPECT_FALSE(fixture.store().get_quarantined(memory.memory_id).has_value());

  auto audit = fixture.store().get_audit_log(fixture.ns(), {});
  ASSERT_EQ(audit.size(), 1u);
  EXPECT_EQ(audit[0].action, audit_action_t::create);
  EXPECT_EQ(audit[0].resource_id, memory.memory_id);
}

TEST(lifecycle_manager, low_confidence_create_lands_in_quarantine) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("suspicious payload");

  EXPECT_EQ(memory.status, memory_status_t::quarantined);
  EXPECT_TRUE(memory.ingestion.quarantined);
  EXPECT_EQ(memory.provenance[0].reason,
            "Created from user_input and quarantined (30% confidence)");
  EXPECT_FALSE(fixture.store().get_memory(memory.memory_id).has_value());
  EXPECT_TRUE(fixture.store().get_quarantined(memory.memory_id).has_value());

  auto fetched = fixture.manager().get_memory(memory.memory_id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(fetched->status, memory_status_t::quarantined);
}

TEST(lifecycle_manager, default_validator_rejects_empty_content) {
  auto fixture = mnemo::testing::basic_lifecycle_fixture<>{
      mnemo::config::engine_options{},
      mnemo::validation::make_default_validator()};
  auto result = fixture.manager().create_memory(fixture.input("   \n  "));

  EXPECT_EQ(result.code, code_of(lifecycle_error_code::validation_rejected));
  EXPECT_EQ(result.codespace, "mnemo.lifecycle.create");
  EXPECT_EQ(result.info, "Memory content is empty");
  EXPECT_FALSE(result.memory.has_value());
  EXPECT_TRUE(fixture.manager().list_memories(fixture.ns()).empty());
}

TEST(lifecycle_manager, default_ttl_policy_sets_expiry) {
  auto options = mnemo::config::engine_options{};
  options.ttl.enabled = true;
  options.ttl.default_ttl_days = 2.0;
  auto fixture = lifecycle_fixture{options};

  auto memory = fixture.create("short lived");
  ASSERT_TRUE(memory.expires_at.has_value());
  EXPECT_EQ(*memory.expires_at, "2026-01-17T00:00:00.000Z");

  auto explicit_ttl = fixture.input("caller ttl");
  explicit_ttl.ttl_seconds = 60;
  auto result = fixture.manager().create_memory(explicit_ttl);
  ASSERT_TRUE(result.memory.has_value());
  EXPECT_FALSE(result.memory->expires_at.has_value());
}

TEST(lifecycle_manager, huge_default_ttl_saturates_expiry) {
  auto options = mnemo::config::engine_options{};
  options.ttl.enabled = true;
  options.ttl.default_ttl_days = 1e300;
  auto fixture = lifecycle_fixture{options};

  auto memory = fixture.create("practically permanent");
  ASSERT_TRUE(memory.expires_at.has_value());
  EXPECT_EQ(*memory.expires_at, "9999-12-31T23:59:59.999Z");

  fixture.clock().advance_hours(24 * 365);
  auto result = fixture.manager().expire_memories(fixture.ns());
  EXPECT_EQ(result.expired_count, 0u);
  EXPECT_EQ(fixture.manager().get_memory(memory.memory_id)->status,
            memory_status_t::active);
}

TEST(lifecycle_manager, edit_snapshots_and_increments_version) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("original", {"a"});
  fixture.clock().advance_hours(1);

  auto updates = edit_memory_t{};
  updates.content = "revised";
  updates.importance = 0.9;
  auto result = fixture.manager().edit_memory(memory.memory_id, updates,
                                              "editor", "typo fix");

  ASSERT_EQ(result.code, 0u);
  const auto& edited = *result.memory;
  EXPECT_EQ(edited.version, 2u);
  EXPECT_EQ(edited.content, "revised");
  EXPECT_DOUBLE_EQ(edited.importance, 0.9);
  EXPECT_EQ(edited.tags, (tag_list_t{"a"}));
  ASSERT_EQ(edited.previous_versions.size(), 1u);
  EXPECT_EQ(edited.previous_versions[0].version, 1u);
  EXPECT_EQ(edited.previous_versions[0].content, "original");
  EXPECT_EQ(edited.previous_versions[0].superseded_by, "editor");
  EXPECT_EQ(edited.previous_versions[0].change_reason, "typo fix");

  ASSERT_EQ(edited.provenance.size(), 2u);
  const auto& entry = edited.provenance.back();
  EXPECT_EQ(entry.action, provenance_action_t::edited);
  EXPECT_EQ(entry.version, 2u);
  EXPECT_EQ(entry.previous_content, "original");
  EXPECT_EQ(entry.reason, "typo fix");
  expect_versions_below_current(edited);
}

TEST(lifecycle_manager, edit_without_reason_uses_default) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("original");
  auto updates = edit_memory_t{};
  updates.tags = tag_list_t{"x", "y"};

  auto result =
      fixture.manager().edit_memory(memory.memory_id, updates, "editor");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.memory->provenance.back().reason, "Memory edited");
  EXPECT_EQ(result.memory->content, "original");
  EXPECT_EQ(result.memory->tags, (tag_list_t{"x", "y"}));
}

TEST(lifecycle_manager, versions_and_provenance_only_grow) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("v1");
  auto last_version = memory.version;
  auto last_provenance = memory.provenance.size();

  for (auto i = 2; i <= 5; ++i) {
    auto updates = edit_memory_t{};
    updates.content = "v" + std::to_string(i);
    auto result =
        fixture.manager().edit_memory(memory.memory_id, updates, "editor");
    ASSERT_EQ(result.code, 0u);
    EXPECT_EQ(result.memory->version, last_version + 1);
    EXPECT_GT(result.memory->provenance.size(), last_provenance);
    expect_versions_below_current(*result.memory);
    last_version = result.memory->version;
    last_provenance = result.memory->provenance.size();
  }

  auto rolled = fixture.manager().rollback_memory(memory.memory_id, 2, "editor");
  ASSERT_EQ(rolled.code, 0u);
  EXPECT_EQ(rolled.memory->version, last_version + 1);
  expect_versions_below_current(*rolled.memory);
}

TEST(lifecycle_manager, edit_rejects_missing_and_deleted) {
  auto fixture = lifecycle_fixture{};
  auto missing =
      fixture.manager().edit_memory("nope", edit_memory_t{}, "editor");
  EXPECT_EQ(missing.code, code_of(lifecycle_error_code::not_found));
  EXPECT_EQ(missing.codespace, "mnemo.lifecycle.edit");

  auto memory = fixture.create("doomed");
  ASSERT_EQ(fixture.manager()
                .delete_memory(memory.memory_id, "admin", "cleanup")
                .code,
            0u);
  auto edited =
      fixture.manager().edit_memory(memory.memory_id, edit_memory_t{}, "editor");
  EXPECT_EQ(edited.code, code_of(lifecycle_error_code::invalid_transition));

  auto stored = fixture.manager().get_memory(memory.memory_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->version, 1u);
}

TEST(lifecycle_manager, delete_is_soft_and_terminal) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("to delete");
  auto result =
      fixture.manager().delete_memory(memory.memory_id, "admin", "obsolete");

  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.memory->status, memory_status_t::deleted);
  EXPECT_EQ(result.memory->content, "to delete");
  EXPECT_EQ(result.memory->provenance.back().action,
            provenance_action_t::deleted);
  EXPECT_EQ(result.memory->provenance.back().reason, "obsolete");

  auto again =
      fixture.manager().delete_memory(memory.memory_id, "admin", "obsolete");
  EXPECT_EQ(again.code, code_of(lifecycle_error_code::already_in_state));

  EXPECT_TRUE(fixture.manager().list_memories(fixture.ns()).empty());
  auto deleted_only = list_memory_options_t{};
  deleted_only.status = memory_status_t::deleted;
  EXPECT_EQ(fixture.manager().list_memories(fixture.ns(), deleted_only).size(),
            1u);

  auto quarantined = fixture.manager().quarantine_memory(memory.memory_id,
                                                         "admin", "late");
  EXPECT_EQ(quarantined.code, code_of(lifecycle_error_code::invalid_transition));
  auto rolled = fixture.manager().rollback_memory(memory.memory_id, 1, "admin");
  EXPECT_EQ(rolled.code, code_of(lifecycle_error_code::invalid_transition));
}

TEST(lifecycle_manager, quarantine_moves_memory_between_partitions) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("questionable fact");
  auto result = fixture.manager().quarantine_memory(memory.memory_id,
                                                    "moderator", "disputed");

  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.memory->status, memory_status_t::quarantined);
  EXPECT_TRUE(result.memory->ingestion.quarantined);
  EXPECT_EQ(result.memory->provenance.back().action,
            provenance_action_t::quarantined);
  EXPECT_FALSE(fixture.store().get_memory(memory.memory_id).has_value());
  EXPECT_TRUE(fixture.store().get_quarantined(memory.memory_id).has_value());

  auto again = fixture.manager().quarantine_memory(memory.memory_id,
                                                   "moderator", "disputed");
  EXPECT_EQ(again.code, code_of(lifecycle_error_code::already_in_state));

  auto missing = fixture.manager().quarantine_memory("nope", "moderator", "x");
  EXPECT_EQ(missing.code, code_of(lifecycle_error_code::not_found));
}

TEST(lifecycle_manager, quarantine_promote_round_trip) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("suspicious but true");
  ASSERT_EQ(memory.status, memory_status_t::quarantined);
  ASSERT_EQ(fixture.manager().list_quarantined(fixture.ns()).size(), 1u);

  auto result =
      fixture.manager().promote_quarantined(memory.memory_id, "moderator");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.memory->status, memory_status_t::active);
  EXPECT_FALSE(result.memory->ingestion.quarantined);
  EXPECT_EQ(result.memory->provenance.back().action,
            provenance_action_t::modified);
  EXPECT_EQ(result.memory->provenance.back().reason,
            "Promoted from quarantine");

  EXPECT_FALSE(fixture.store().get_quarantined(memory.memory_id).has_value());
  auto primary = fixture.store().get_memory(memory.memory_id);
  ASSERT_TRUE(primary.has_value());
  EXPECT_FALSE(primary->ingestion.quarantined);
  EXPECT_TRUE(fixture.manager().list_quarantined(fixture.ns()).empty());

  auto again =
      fixture.manager().promote_quarantined(memory.memory_id, "moderator");
  EXPECT_EQ(again.code, code_of(lifecycle_error_code::not_found));
}

TEST(lifecycle_manager, promote_resumes_after_partial_failure) {
  auto fixture = faulty_lifecycle_fixture{};
  auto memory = fixture.create("suspicious entry");
  fixture.store().delete_quarantined_fault_countdown = 1;

  EXPECT_THROW(
      fixture.manager().promote_quarantined(memory.memory_id, "moderator"),
      std::runtime_error);
  EXPECT_TRUE(fixture.store().get_memory(memory.memory_id).has_value());
  EXPECT_TRUE(fixture.store().get_quarantined(memory.memory_id).has_value());

  auto retry =
      fixture.manager().promote_quarantined(memory.memory_id, "moderator");
  ASSERT_EQ(retry.code, 0u);
  EXPECT_EQ(retry.info, "resumed");
  EXPECT_FALSE(fixture.store().get_quarantined(memory.memory_id).has_value());
  auto primary = fixture.store().get_memory(memory.memory_id);
  ASSERT_TRUE(primary.has_value());
  auto promotions = std::count_if(
      std::begin(primary->provenance), std::end(primary->provenance),
      [](const auto& entry) {
        return entry.action == provenance_action_t::modified;
      });
  EXPECT_EQ(promotions, 1);
}

TEST(lifecycle_manager, quarantine_resumes_after_partial_failure) {
  auto fixture = faulty_lifecycle_fixture{};
  auto memory = fixture.create("plain fact");
  fixture.store().remove_memory_fault_countdown = 1;

  EXPECT_THROW(
      fixture.manager().quarantine_memory(memory.memory_id, "mod", "check"),
      std::runtime_error);
  auto retry =
      fixture.manager().quarantine_memory(memory.memory_id, "mod", "check");
  ASSERT_EQ(retry.code, 0u);
  EXPECT_EQ(retry.info, "resumed");
  EXPECT_FALSE(fixture.store().get_memory(memory.memory_id).has_value());
  EXPECT_TRUE(fixture.store().get_quarantined(memory.memory_id).has_value());
}

TEST(lifecycle_manager, rollback_round_trip_restores_fields) {
  auto fixture = lifecycle_fixture{};
  auto input = fixture.input("Deploy on Fridays", {"ops", "policy"});
  input.importance = 0.4;
  input.task_criticality = 0.6;
  auto created = fixture.manager().create_memory(input);
  ASSERT_EQ(created.code, 0u);
  const auto id = created.memory->memory_id;

  auto updates = edit_memory_t{};
  updates.content = "Never deploy on Fridays";
  updates.tags = tag_list_t{"ops"};
  updates.importance = 0.95;
  updates.task_criticality = 0.1;
  updates.content_type = "markdown";
  ASSERT_EQ(fixture.manager().edit_memory(id, updates, "editor").code, 0u);

  auto result = fixture.manager().rollback_memory(id, 1, "editor");
  ASSERT_EQ(result.code, 0u);
  const auto& memory = *result.memory;
  EXPECT_EQ(memory.content, "Deploy on Fridays");
  EXPECT_EQ(memory.content_type, "text");
  EXPECT_EQ(memory.tags, (tag_list_t{"ops", "policy"}));
  EXPECT_DOUBLE_EQ(memory.importance, 0.4);
  EXPECT_DOUBLE_EQ(memory.task_criticality, 0.6);
  EXPECT_EQ(memory.version, 3u);
  ASSERT_EQ(memory.previous_versions.size(), 2u);
  EXPECT_EQ(memory.previous_versions[0].version, 1u);
  EXPECT_EQ(memory.previous_versions[1].version, 2u);
  EXPECT_EQ(memory.previous_versions[1].content, "Never deploy on Fridays");
  EXPECT_EQ(memory.previous_versions[1].change_reason,
            "Rolled back to version 1");

  const auto& entry = memory.provenance.back();
  EXPECT_EQ(entry.action, provenance_action_t::rolled_back);
  EXPECT_EQ(entry.version, 3u);
  EXPECT_EQ(entry.previous_content, "Never deploy on Fridays");
}

TEST(lifecycle_manager, rollback_reports_missing_versions) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("only version");

  auto no_history =
      fixture.manager().rollback_memory(memory.memory_id, 1, "editor");
  EXPECT_EQ(no_history.code, code_of(lifecycle_error_code::version_not_found));

  auto updates = edit_memory_t{};
  updates.content = "second";
  ASSERT_EQ(
      fixture.manager().edit_memory(memory.memory_id, updates, "editor").code,
      0u);
  auto wrong = fixture.manager().rollback_memory(memory.memory_id, 7, "editor");
  EXPECT_EQ(wrong.code, code_of(lifecycle_error_code::version_not_found));
  EXPECT_EQ(wrong.info, "available versions: 1");

  auto current = fixture.manager().rollback_memory(memory.memory_id, 2, "editor");
  EXPECT_EQ(current.code, code_of(lifecycle_error_code::version_not_found));
}

TEST(lifecycle_manager, expire_applies_ttl_rules) {
  auto fixture = lifecycle_fixture{};
  auto zero_ttl = fixture.input("instant");
  zero_ttl.ttl_seconds = 0;
  auto hour_ttl = fixture.input("one hour");
  hour_ttl.ttl_seconds = 3600;
  auto day_ttl = fixture.input("one day");
  day_ttl.ttl_seconds = 86400;

  auto instant = fixture.manager().create_memory(zero_ttl).memory->memory_id;
  auto hourly = fixture.manager().create_memory(hour_ttl).memory->memory_id;
  auto daily = fixture.manager().create_memory(day_ttl).memory->memory_id;
  auto permanent = fixture.create("forever").memory_id;

  fixture.clock().advance_hours(2);
  auto result = fixture.manager().expire_memories(fixture.ns());

  EXPECT_EQ(result.expired_count, 2u);
  EXPECT_NE(std::find(std::begin(result.expired_ids),
                      std::end(result.expired_ids), instant),
            std::end(result.expired_ids));
  EXPECT_NE(std::find(std::begin(result.expired_ids),
                      std::end(result.expired_ids), hourly),
            std::end(result.expired_ids));

  auto expired = fixture.manager().get_memory(instant);
  ASSERT_TRUE(expired.has_value());
  EXPECT_EQ(expired->status, memory_status_t::deleted);
  EXPECT_EQ(expired->provenance.back().action, provenance_action_t::expired);
  EXPECT_EQ(expired->provenance.back().actor_id, "system");
  EXPECT_EQ(expired->provenance.back().reason, "TTL expired");
  EXPECT_EQ(fixture.manager().get_memory(daily)->status,
            memory_status_t::active);
  EXPECT_EQ(fixture.manager().get_memory(permanent)->status,
            memory_status_t::active);

  auto audit = fixture.store().get_audit_log(fixture.ns(), {});
  ASSERT_FALSE(audit.empty());
  EXPECT_EQ(audit.front().resource_id, "batch:2");
  EXPECT_EQ(audit.front().action, audit_action_t::remove);

  auto second = fixture.manager().expire_memories(fixture.ns());
  EXPECT_EQ(second.expired_count, 0u);
}

TEST(lifecycle_manager, expire_removes_memories_past_expires_at) {
  auto options = mnemo::config::engine_options{};
  options.ttl.enabled = true;
  options.ttl.default_ttl_days = 2.0;
  auto fixture = lifecycle_fixture{options};

  auto memory = fixture.create("expires with the default policy");
  ASSERT_TRUE(memory.expires_at.has_value());
  ASSERT_FALSE(memory.ttl_seconds.has_value());

  fixture.clock().advance_hours(47);
  EXPECT_EQ(fixture.manager().expire_memories(fixture.ns()).expired_count, 0u);
  EXPECT_EQ(fixture.manager().get_memory(memory.memory_id)->status,
            memory_status_t::active);

  fixture.clock().advance_hours(2);
  auto result = fixture.manager().expire_memories(fixture.ns());
  EXPECT_EQ(result.expired_count, 1u);
  EXPECT_EQ(result.expired_ids, (std::vector<memory_id_t>{memory.memory_id}));

  auto expired = fixture.manager().get_memory(memory.memory_id);
  ASSERT_TRUE(expired.has_value());
  EXPECT_EQ(expired->status, memory_status_t::deleted);
  EXPECT_EQ(expired->provenance.back().action, provenance_action_t::expired);
}

TEST(lifecycle_manager, expire_sweeps_in_batches) {
  auto options = mnemo::config::engine_options{};
  options.expire_batch_size = 2;
  auto fixture = lifecycle_fixture{options};

  auto expiring = std::vector<memory_id_t>{};
  for (auto i = 0; i < 7; ++i) {
    auto input = fixture.input("memory " + std::to_string(i));
    if (i % 2 == 0) {
      input.ttl_seconds = 0;
    }
    auto id = fixture.manager().create_memory(input).memory->memory_id;
    if (i % 2 == 0) {
      expiring.push_back(id);
    }
    fixture.clock().advance(1000);
  }

  auto result = fixture.manager().expire_memories(fixture.ns());
  EXPECT_EQ(result.expired_count, expiring.size());
  EXPECT_EQ(result.expired_ids, expiring);
  EXPECT_EQ(fixture.manager().list_memories(fixture.ns()).size(), 3u);
}

TEST(lifecycle_manager, decay_policy_expires_stale_memories) {
  auto options = mnemo::config::engine_options{};
  options.ttl.decay_enabled = true;
  options.slo.freshness.max_age_hours = 24;
  auto fixture = lifecycle_fixture{options};

  auto old_id = fixture.create("old news").memory_id;
  fixture.clock().advance_hours(20);
  auto recent_id = fixture.create("recent news").memory_id;
  fixture.clock().advance_hours(5);

  auto result = fixture.manager().expire_memories(fixture.ns());
  ASSERT_EQ(result.expired_count, 1u);
  EXPECT_EQ(result.expired_ids[0], old_id);
  EXPECT_EQ(fixture.manager().get_memory(old_id)->provenance.back().reason,
            "Freshness SLO exceeded");
  EXPECT_EQ(fixture.manager().get_memory(recent_id)->status,
            memory_status_t::active);
}

TEST(lifecycle_manager, invalidate_marks_for_next_sweep) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("wrong fact");
  auto result = fixture.manager().invalidate_memory(memory.memory_id, "critic",
                                                    "contradicted");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.memory->ttl_seconds, 0u);
  EXPECT_EQ(result.memory->status, memory_status_t::active);
  EXPECT_EQ(result.memory->provenance.back().action,
            provenance_action_t::invalidated);

  auto swept = fixture.manager().expire_memories(fixture.ns());
  EXPECT_EQ(swept.expired_count, 1u);
}

TEST(lifecycle_manager, record_access_tracks_cross_session_recall) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("shared fact", {}, "session-a");
  fixture.clock().advance_hours(3);

  auto first = fixture.manager().record_access(memory.memory_id, "agent",
                                               "checkpoint-1", "session-b");
  ASSERT_EQ(first.code, 0u);
  EXPECT_EQ(first.memory->last_accessed_at, "2026-01-15T03:00:00.000Z");
  EXPECT_EQ(first.memory->checkpoint_refs,
            (std::vector<std::string>{"checkpoint-1"}));
  EXPECT_EQ(first.memory->cross_session_recall_count, 1u);
  EXPECT_EQ(first.memory->provenance.back().action,
            provenance_action_t::accessed);
  EXPECT_EQ(first.memory->provenance.back().checkpoint_id, "checkpoint-1");

  auto repeat = fixture.manager().record_access(memory.memory_id, "agent",
                                                "checkpoint-1", "session-b");
  EXPECT_EQ(repeat.memory->cross_session_recall_count, 1u);
  EXPECT_EQ(repeat.memory->checkpoint_refs.size(), 1u);

  auto origin = fixture.manager().record_access(memory.memory_id, "agent",
                                                std::nullopt, "session-a");
  EXPECT_EQ(origin.memory->cross_session_recall_count, 1u);
}

TEST(lifecycle_manager, link_to_checkpoint_appends_cited_entry) {
  auto fixture = lifecycle_fixture{};
  auto memory = fixture.create("cited fact");
  auto result = fixture.manager().link_to_checkpoint(memory.memory_id,
                                                     "checkpoint-9", "agent");
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.memory->checkpoint_refs,
            (std::vector<std::string>{"checkpoint-9"}));
  EXPECT_EQ(result.memory->provenance.back().action, provenance_action_t::cited);
  EXPECT_EQ(result.memory->provenance.back().reason, "Referenced in checkpoint");

  auto log = fixture.manager().memory_audit_log(memory.memory_id);
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[1].checkpoint_id, "checkpoint-9");
  EXPECT_TRUE(fixture.manager().memory_audit_log("nope").empty());
}

TEST(lifecycle_manager, audit_failure_does_not_fail_mutation) {
  auto fixture = faulty_lifecycle_fixture{};
  auto lost = std::vector<audit_entry_t>{};
  fixture.manager().on_audit_failure(
      [&lost](const audit_entry_t& entry) { lost.push_back(entry); });

  fixture.store().fail_audit = true;
  auto memory = fixture.create("audited");
  fixture.store().throw_on_audit = true;
  auto result =
      fixture.manager().delete_memory(memory.memory_id, "admin", "cleanup");

  EXPECT_EQ(result.code, 0u);
  ASSERT_EQ(lost.size(), 2u);
  EXPECT_EQ(lost[0].action, audit_action_t::create);
  EXPECT_EQ(lost[1].action, audit_action_t::remove);
  EXPECT_EQ(fixture.manager().get_memory(memory.memory_id)->status,
            memory_status_t::deleted);
}

TEST(lifecycle_manager, session_history_groups_by_origin) {
  auto fixture = lifecycle_fixture{};
  fixture.create("first", {"a"}, "session-1");
  fixture.clock().advance_hours(1);
  fixture.create("second", {"a"}, "session-1");
  fixture.clock().advance_hours(1);
  fixture.create("third", {"b"}, "session-2");
  fixture.create("no session");

  auto history = fixture.manager().session_history(fixture.ns());
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.back().session_id, "session-1");
  EXPECT_EQ(history.back().memory_count, 2u);
  EXPECT_EQ(history.back().started_at, "2026-01-15T00:00:00.000Z");

  EXPECT_EQ(fixture.manager().session_memories(fixture.ns(), "session-1").size(),
            2u);
  EXPECT_TRUE(fixture.manager().session_memories(fixture.ns(), "other").empty());
}

TEST(lifecycle_manager, check_drift_alerts_on_unrelated_topics) {
  auto fixture = lifecycle_fixture{};
  fixture.create("alpha", {"a", "b"}, "session-1");
  fixture.clock().advance(1000);
  fixture.create("beta", {"c", "d"}, "session-1");
  fixture.clock().advance(1000);
  fixture.create("gamma", {"e", "f"}, "session-1");

  auto check = fixture.manager().check_drift(fixture.ns(), "session-1");
  EXPECT_TRUE(check.alert);
  EXPECT_EQ(check.metrics.topic_changes, 2u);

  auto empty = fixture.manager().check_drift(fixture.ns(), "session-9");
  EXPECT_FALSE(empty.alert);
  EXPECT_DOUBLE_EQ(empty.metrics.drift_score, 0.0);
  EXPECT_DOUBLE_EQ(empty.metrics.coherence_score, 1.0);
}
