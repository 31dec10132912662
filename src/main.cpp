#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <mnemo/config/options.hpp>
#include <mnemo/lifecycle/manager.hpp>
#include <mnemo/storage/rocksdb/store.hpp>
#include <exception>
#include <iostream>
#include <string>

namespace {

using store_tag_t = mnemo::storage::rocksdb_store_tag;
using manager_t = mnemo::lifecycle::manager<store_tag_t>;

void print_memory_line(const mnemo::schema::memory_object_t& memory) {
  std::cout << fmt::format("{}  v{}  {}  confidence={:.2f}  {}\n",
                           memory.memory_id, memory.version,
                           mnemo::schema::to_string(memory.status),
                           memory.ingestion.confidence_score,
                           memory.created_at);
}

int run_expire(manager_t& manager, const mnemo::schema::namespace_id_t& ns) {
  auto result = manager.expire_memories(ns);
  std::cout << fmt::format("Expired {} memories\n", result.expired_count);
  for (const auto& id : result.expired_ids) {
    std::cout << "  " << id << '\n';
  }
  return 0;
}

int run_sessions(manager_t& manager, const mnemo::schema::namespace_id_t& ns) {
  for (const auto& entry : manager.session_history(ns)) {
    std::cout << fmt::format("{}  started={}  memories={}  cross_recalls={}\n",
                             entry.session_id, entry.started_at,
                             entry.memory_count, entry.cross_session_recalls);
  }
  return 0;
}

int run_drift(manager_t& manager,
              const mnemo::schema::namespace_id_t& ns,
              const std::string& session_id) {
  if (session_id.empty()) {
    spdlog::error("--session is required for the drift command");
    return 1;
  }
  auto check = manager.check_drift(ns, session_id);
  const auto& metrics = check.metrics;
  std::cout << fmt::format(
      "session={}  drift={:.3f}  coherence={:.3f}  fragmentation={:.3f}  "
      "topic_changes={}  alert={}\n",
      session_id, metrics.drift_score, metrics.coherence_score,
      metrics.fragmentation_score, metrics.topic_changes, check.alert);
  return check.alert ? 2 : 0;
}

int run_quarantined(manager_t& manager,
                    const mnemo::schema::namespace_id_t& ns) {
  for (const auto& memory : manager.list_quarantined(ns)) {
    print_memory_line(memory);
  }
  return 0;
}

int run_audit(manager_t& manager,
              mnemo::storage::store<store_tag_t>& store,
              const mnemo::schema::namespace_id_t& ns,
              const std::string& memory_id) {
  if (!memory_id.empty()) {
    for (const auto& entry : manager.memory_audit_log(memory_id)) {
      std::cout << fmt::format("{}  {}  {}  {}\n", entry.timestamp,
                               mnemo::schema::to_string(entry.action),
                               entry.actor_id, entry.reason.value_or(""));
    }
    return 0;
  }
  for (const auto& entry : store.get_audit_log(ns, {})) {
    std::cout << fmt::format("{}  {}  {}  {}\n", entry.timestamp,
                             mnemo::schema::to_string(entry.action),
                             entry.resource_id, entry.actor_id);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("mnemo.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "mnemo", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto config_path = std::string{};
  auto command = std::string{};
  auto session_id = std::string{};
  auto memory_id = std::string{};
  auto ns = mnemo::schema::namespace_id_t{};
  auto user_id = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Mnemo"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "mnemo.db"),
      "RocksDB directory")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "Engine options file")(
      "org", boost::program_options::value<std::string>(&ns.org_id)->required(),
      "Organization id")(
      "app", boost::program_options::value<std::string>(&ns.app_id)->required(),
      "Application id")(
      "agent",
      boost::program_options::value<std::string>(&ns.agent_id)->required(),
      "Agent id")("user", boost::program_options::value<std::string>(&user_id),
                  "User id")(
      "command",
      boost::program_options::value<std::string>(&command)->required(),
      "expire | sessions | drift | quarantined | audit")(
      "session", boost::program_options::value<std::string>(&session_id),
      "Session id for the drift command")(
      "memory", boost::program_options::value<std::string>(&memory_id),
      "Memory id for the audit command")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    spdlog::error("{}", ex.what());
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }
  if (!user_id.empty()) {
    ns.user_id = user_id;
  }

  auto options = mnemo::config::engine_options{};
  if (!config_path.empty()) {
    try {
      options = mnemo::config::load_options(config_path);
    } catch (const std::exception& ex) {
      spdlog::error("Invalid config '{}': {}", config_path, ex.what());
      spdlog::shutdown();
      return 1;
    }
  }
  if (auto violations = mnemo::config::validate_options(options);
      !violations.empty()) {
    for (const auto& violation : violations) {
      spdlog::error("Config: {}", violation);
    }
    spdlog::shutdown();
    return 1;
  }

  auto store = mnemo::storage::make_store<store_tag_t>(db_path);
  auto manager = manager_t{store, options};
  manager.on_audit_failure([](const mnemo::schema::audit_entry_t& entry) {
    spdlog::error("Audit row {} for {} lost", entry.id, entry.resource_id);
  });

  auto exit_code = 0;
  if (command == "expire") {
    exit_code = run_expire(manager, ns);
  } else if (command == "sessions") {
    exit_code = run_sessions(manager, ns);
  } else if (command == "drift") {
    exit_code = run_drift(manager, ns, session_id);
  } else if (command == "quarantined") {
    exit_code = run_quarantined(manager, ns);
  } else if (command == "audit") {
    exit_code = run_audit(manager, store, ns, memory_id);
  } else {
    spdlog::error("Unknown command '{}'", command);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
