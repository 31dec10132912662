#pragma once

#include <mnemo/lifecycle/manager.hpp>
#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/validation/validator.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace mnemo::testing {

inline mnemo::schema::timestamp_milliseconds_t make_time(
    const std::string_view iso) {
  auto parsed = mnemo::schema::try_parse_timestamp(iso);
  if (!parsed) {
    throw std::invalid_argument{std::string{iso}};
  }
  return *parsed;
}

inline const mnemo::schema::timestamp_milliseconds_t kBaseTime =
    make_time("2026-01-15T00:00:00.000Z");

/// Clock shared by value with the code under test. Each read advances the
/// time by `step`.
class manual_clock final {
 public:
  explicit manual_clock(const mnemo::schema::timestamp_milliseconds_t now)
      : now_{std::make_shared<std::atomic<mnemo::schema::timestamp_milliseconds_t>>(
            now)},
        step_{std::make_shared<std::atomic<mnemo::schema::timestamp_milliseconds_t>>(
            0)} {}

  mnemo::lifecycle::clock_function_t function() const {
    auto now = now_;
    auto step = step_;
    return [now, step] { return now->fetch_add(step->load()); };
  }

  mnemo::schema::timestamp_milliseconds_t now() const { return now_->load(); }

  void set(const mnemo::schema::timestamp_milliseconds_t now) {
    now_->store(now);
  }

  void advance(const mnemo::schema::timestamp_milliseconds_t milliseconds) {
    now_->fetch_add(milliseconds);
  }

  void advance_hours(const double hours) {
    advance(static_cast<mnemo::schema::timestamp_milliseconds_t>(
        hours * static_cast<double>(mnemo::schema::kMillisecondsPerHour)));
  }

  void set_step(const mnemo::schema::timestamp_milliseconds_t step) {
    step_->store(step);
  }

 private:
  std::shared_ptr<std::atomic<mnemo::schema::timestamp_milliseconds_t>> now_;
  std::shared_ptr<std::atomic<mnemo::schema::timestamp_milliseconds_t>> step_;
};

inline mnemo::schema::namespace_id_t make_namespace(
    const std::string_view agent = "agent-1") {
  auto ns = mnemo::schema::namespace_id_t{};
  ns.org_id = "acme";
  ns.app_id = "assistant";
  ns.agent_id = std::string{agent};
  return ns;
}

/// Accepts everything verbatim with a fixed confidence.
inline mnemo::validation::validator_t accepting_validator(
    const double confidence = 0.9) {
  return [confidence](const mnemo::schema::validation_input_t& input) {
    auto result = mnemo::schema::validation_result_t{};
    result.accepted = true;
    result.source_type = input.source_type;
    result.source_id = input.source_id;
    result.normalized_content = input.content;
    result.normalized_content_type = input.declared_content_type.value_or("text");
    result.confidence_score = confidence;
    return result;
  };
}

/// Quarantines content containing `marker`, accepts the rest.
inline mnemo::validation::validator_t quarantining_validator(
    std::string marker = "suspicious") {
  return [marker = std::move(marker)](
             const mnemo::schema::validation_input_t& input) {
    auto result = accepting_validator()(input);
    if (input.content.find(marker) != std::string::npos) {
      result.quarantined = true;
      result.confidence_score = 0.3;
      result.anomaly_flags.emplace_back("repeated_tokens");
    }
    return result;
  };
}

/// A memory object built directly, bypassing the lifecycle manager.
inline mnemo::schema::memory_object_t make_memory(
    const std::string& id,
    const mnemo::schema::timestamp_milliseconds_t created_at,
    mnemo::schema::tag_list_t tags = {},
    const mnemo::schema::namespace_id_t& ns = make_namespace()) {
  auto memory = mnemo::schema::memory_object_t{};
  memory.memory_id = id;
  memory.ns = ns;
  memory.content = "content of " + id;
  memory.created_at = mnemo::schema::format_timestamp(created_at);
  memory.source.timestamp = memory.created_at;
  memory.tags = std::move(tags);
  memory.provenance.push_back(mnemo::schema::provenance_entry_t{
      .action = mnemo::schema::provenance_action_t::created,
      .actor_id = "tester",
      .timestamp = memory.created_at});
  return memory;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace mnemo::testing
