#pragma once

#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/session_history_entry.hpp>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::session {

/// Bucket for memories created outside any session.
inline constexpr auto kDefaultSessionId = std::string_view{"default"};

/// Group memories by originating session. Each entry starts at its earliest
/// member and sums the members' cross-session recalls; entries are ordered
/// newest start first.
std::vector<mnemo::schema::session_history_entry_t> group_by_session(
    const mnemo::schema::namespace_id_t& ns,
    const std::vector<mnemo::schema::memory_object_t>& memories);

/// Memories whose originating session is `session_id`.
std::vector<mnemo::schema::memory_object_t> filter_by_session(
    const std::vector<mnemo::schema::memory_object_t>& memories,
    std::string_view session_id);

/// True when `session_id` is a session other than the memory's origin and
/// has not recalled it before.
bool is_new_cross_session_access(const mnemo::schema::memory_object_t& memory,
                                 std::string_view session_id);

/// Caller-owned record of explicitly started sessions, keyed by namespace.
class session_registry final {
 public:
  void record_session(mnemo::schema::session_history_entry_t entry);

  /// Close the latest matching session; false when it is unknown.
  bool end_session(std::string_view namespace_key,
                   std::string_view session_id,
                   std::string ended_at);

  std::vector<mnemo::schema::session_history_entry_t> history(
      std::string_view namespace_key) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<mnemo::schema::session_history_entry_t>,
           std::less<>>
      sessions_;
};

}  // namespace mnemo::session
