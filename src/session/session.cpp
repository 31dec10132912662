#include <mnemo/session/session.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

using namespace mnemo::schema;

namespace mnemo::session {

std::vector<session_history_entry_t> group_by_session(
    const namespace_id_t& ns,
    const std::vector<memory_object_t>& memories) {
  auto key = make_namespace_key(ns);
  auto grouped = std::map<std::string, session_history_entry_t>{};
  for (const auto& memory : memories) {
    auto session_id = memory.session_id.value_or(std::string{kDefaultSessionId});
    auto [it, inserted] = grouped.try_emplace(session_id);
    auto& entry = it->second;
    if (inserted) {
      entry.session_id = session_id;
      entry.namespace_key = key;
      entry.started_at = memory.created_at;
    }
    entry.memory_ids.push_back(memory.memory_id);
    ++entry.memory_count;
    entry.cross_session_recalls += memory.cross_session_recall_count;
    if (memory.created_at < entry.started_at) {
      entry.started_at = memory.created_at;
    }
  }

  auto sessions = std::vector<session_history_entry_t>{};
  sessions.reserve(grouped.size());
  for (auto& [session_id, entry] : grouped) {
    sessions.push_back(std::move(entry));
  }
  auto start = [](const session_history_entry_t& entry) {
    return try_parse_timestamp(entry.started_at)
        .value_or(std::numeric_limits<timestamp_milliseconds_t>::min());
  };
  std::stable_sort(std::begin(sessions), std::end(sessions),
                   [&start](const auto& lhs, const auto& rhs) {
                     return start(lhs) > start(rhs);
                   });
  return sessions;
}

std::vector<memory_object_t> filter_by_session(
    const std::vector<memory_object_t>& memories,
    const std::string_view session_id) {
  auto matching = std::vector<memory_object_t>{};
  std::copy_if(std::begin(memories), std::end(memories),
               std::back_inserter(matching), [session_id](const auto& memory) {
                 return memory.session_id && *memory.session_id == session_id;
               });
  return matching;
}

bool is_new_cross_session_access(const memory_object_t& memory,
                                 const std::string_view session_id) {
  if (session_id.empty()) {
    return false;
  }
  if (memory.session_id && *memory.session_id == session_id) {
    return false;
  }
  return std::find(std::begin(memory.accessed_in_sessions),
                   std::end(memory.accessed_in_sessions),
                   session_id) == std::end(memory.accessed_in_sessions);
}

void session_registry::record_session(session_history_entry_t entry) {
  auto lock = std::scoped_lock{mutex_};
  auto key = entry.namespace_key;
  sessions_[key].push_back(std::move(entry));
}

bool session_registry::end_session(const std::string_view namespace_key,
                                   const std::string_view session_id,
                                   std::string ended_at) {
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(namespace_key);
  if (it == std::end(sessions_)) {
    return false;
  }
  auto& entries = it->second;
  for (auto entry = std::rbegin(entries); entry != std::rend(entries);
       ++entry) {
    if (entry->session_id == session_id) {
      entry->ended_at = std::move(ended_at);
      return true;
    }
  }
  return false;
}

std::vector<session_history_entry_t> session_registry::history(
    const std::string_view namespace_key) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(namespace_key);
  if (it == std::end(sessions_)) {
    return {};
  }
  return it->second;
}

}  // namespace mnemo::session
