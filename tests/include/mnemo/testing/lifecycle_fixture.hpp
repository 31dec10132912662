#pragma once

#include <mnemo/config/options.hpp>
#include <mnemo/lifecycle/manager.hpp>
#include <mnemo/schema/create_memory.hpp>
#include <mnemo/storage/memory/store.hpp>
#include <mnemo/testing/common.hpp>
#include <mnemo/testing/faulty_store.hpp>

#include <optional>
#include <string>
#include <utility>

namespace mnemo::testing {

/// Lifecycle manager over an in-memory store with a manual clock starting at
/// kBaseTime.
template <typename Library = mnemo::storage::memory_store_tag>
class basic_lifecycle_fixture final {
 public:
  explicit basic_lifecycle_fixture(
      mnemo::config::engine_options options = {},
      mnemo::validation::validator_t validator = quarantining_validator())
      : clock_{kBaseTime},
        store_{},
        manager_{store_, std::move(options), std::move(validator),
                 clock_.function()} {}

  basic_lifecycle_fixture(const basic_lifecycle_fixture&) = delete;
  basic_lifecycle_fixture& operator=(const basic_lifecycle_fixture&) = delete;

  manual_clock& clock() { return clock_; }
  mnemo::storage::store<Library>& store() { return store_; }
  mnemo::lifecycle::manager<Library>& manager() { return manager_; }
  const mnemo::schema::namespace_id_t& ns() const { return ns_; }

  mnemo::schema::create_memory_t input(
      std::string content,
      mnemo::schema::tag_list_t tags = {},
      std::optional<std::string> session_id = std::nullopt) const {
    auto input = mnemo::schema::create_memory_t{};
    input.ns = ns_;
    input.content = std::move(content);
    input.source_type = mnemo::schema::source_type_t::user_input;
    input.source_identifier = "user-1";
    input.tags = std::move(tags);
    input.session_id = std::move(session_id);
    return input;
  }

  /// Create and return the stored memory; the result must succeed.
  mnemo::schema::memory_object_t create(
      std::string content,
      mnemo::schema::tag_list_t tags = {},
      std::optional<std::string> session_id = std::nullopt) {
    auto result = manager_.create_memory(
        input(std::move(content), std::move(tags), std::move(session_id)));
    if (result.code != 0 || !result.memory) {
      throw std::runtime_error{"fixture create failed: " + result.log};
    }
    return *result.memory;
  }

 private:
  manual_clock clock_;
  mnemo::storage::store<Library> store_;
  mnemo::lifecycle::manager<Library> manager_;
  mnemo::schema::namespace_id_t ns_{make_namespace()};
};

using lifecycle_fixture = basic_lifecycle_fixture<>;
using faulty_lifecycle_fixture =
    basic_lifecycle_fixture<mnemo::storage::faulty_store_tag>;

}  // namespace mnemo::testing
