#include "lockstep/config/config.hpp"
#include "lockstep/config/toml_util.hpp"

#include "lockstep/core/error.hpp"
#include "lockstep/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace lockstep {
namespace detail {

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  uint16_t port{5432};
  std::string username{"lockstep"};
  std::string password;
  std::string database{"lockstep"};
  std::string conninfo;
  uint16_t pool_size{4};
  uint16_t connect_timeout{5};
  uint16_t worker_threads{2};
};

struct LocksToml {
  std::string prefix{"lockstep"};
  int64_t default_timeout_ms{30000};
};

struct ExecutorToml {
  int max_concurrency{4};
  int64_t lock_timeout_ms{30000};
  int deadlock_retries{3};
  int64_t deadlock_backoff_ms{1000};
  double backpressure_threshold{0.8};
  int64_t history_size{1000};
};

struct OrchestratorToml {
  int max_concurrent_tasks{3};
  int64_t retry_backoff_ms{1000};
  int64_t shutdown_grace_sec{30};
  int64_t history_size{1000};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  DatabaseToml database{};
  LocksToml locks{};
  ExecutorToml executor{};
  OrchestratorToml orchestrator{};
  LogToml log{};
};

} // namespace detail
} // namespace lockstep

namespace glz {
template <> struct meta<lockstep::detail::DatabaseToml> {
  using T = lockstep::detail::DatabaseToml;
  static constexpr auto value = object(
      "host", &T::host, "port", &T::port, "username", &T::username, "password",
      &T::password, "database", &T::database, "conninfo", &T::conninfo,
      "pool_size", &T::pool_size, "connect_timeout", &T::connect_timeout,
      "worker_threads", &T::worker_threads);
};

template <> struct meta<lockstep::detail::LocksToml> {
  using T = lockstep::detail::LocksToml;
  static constexpr auto value = object("prefix", &T::prefix,
                                       "default_timeout_ms",
                                       &T::default_timeout_ms);
};

template <> struct meta<lockstep::detail::ExecutorToml> {
  using T = lockstep::detail::ExecutorToml;
  static constexpr auto value =
      object("max_concurrency", &T::max_concurrency, "lock_timeout_ms",
             &T::lock_timeout_ms, "deadlock_retries", &T::deadlock_retries,
             "deadlock_backoff_ms", &T::deadlock_backoff_ms,
             "backpressure_threshold", &T::backpressure_threshold,
             "history_size", &T::history_size);
};

template <> struct meta<lockstep::detail::OrchestratorToml> {
  using T = lockstep::detail::OrchestratorToml;
  static constexpr auto value =
      object("max_concurrent_tasks", &T::max_concurrent_tasks,
             "retry_backoff_ms", &T::retry_backoff_ms, "shutdown_grace_sec",
             &T::shutdown_grace_sec, "history_size", &T::history_size);
};

template <> struct meta<lockstep::detail::LogToml> {
  using T = lockstep::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<lockstep::detail::SystemToml> {
  using T = lockstep::detail::SystemToml;
  static constexpr auto value =
      object("database", &T::database, "locks", &T::locks, "executor",
             &T::executor, "orchestrator", &T::orchestrator, "log", &T::log);
};
} // namespace glz

namespace lockstep {
namespace {

template <typename T> auto env_override(const char *name, T &target) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    target = boost::lexical_cast<T>(v);
  }
}

auto env_override_ms(const char *name, std::chrono::milliseconds &target)
    -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    target = std::chrono::milliseconds{boost::lexical_cast<int64_t>(v)};
  }
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  env_override("LOCKSTEP_DB_HOST", cfg.database.host);
  env_override("LOCKSTEP_DB_PORT", cfg.database.port);
  env_override("LOCKSTEP_DB_USERNAME", cfg.database.username);
  env_override("LOCKSTEP_DB_PASSWORD", cfg.database.password);
  env_override("LOCKSTEP_DB_DATABASE", cfg.database.database);
  env_override("LOCKSTEP_DB_CONNINFO", cfg.database.conninfo);
  env_override("LOCKSTEP_DB_POOL_SIZE", cfg.database.pool_size);
  env_override("LOCKSTEP_DB_CONNECT_TIMEOUT", cfg.database.connect_timeout);
  env_override("LOCKSTEP_LOCK_PREFIX", cfg.locks.prefix);
  env_override_ms("LOCKSTEP_LOCK_TIMEOUT_MS", cfg.locks.default_timeout);
  env_override("LOCKSTEP_EXECUTOR_MAX_CONCURRENCY",
               cfg.executor.max_concurrency);
  env_override_ms("LOCKSTEP_EXECUTOR_LOCK_TIMEOUT_MS",
                  cfg.executor.lock_timeout);
  env_override("LOCKSTEP_EXECUTOR_DEADLOCK_RETRIES",
               cfg.executor.deadlock_retries);
  env_override("LOCKSTEP_EXECUTOR_BACKPRESSURE_THRESHOLD",
               cfg.executor.backpressure_threshold);
  env_override("LOCKSTEP_MAX_CONCURRENT_TASKS",
               cfg.orchestrator.max_concurrent_tasks);
  env_override("LOCKSTEP_LOG_LEVEL", cfg.log.level);
  env_override("LOCKSTEP_LOG_FILE", cfg.log.file);
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text, "config");
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.database.host = std::move(raw.database.host);
  cfg.database.port = raw.database.port;
  cfg.database.username = std::move(raw.database.username);
  cfg.database.password = std::move(raw.database.password);
  cfg.database.database = std::move(raw.database.database);
  cfg.database.conninfo = std::move(raw.database.conninfo);
  cfg.database.pool_size = raw.database.pool_size;
  cfg.database.connect_timeout = raw.database.connect_timeout;
  cfg.database.worker_threads = raw.database.worker_threads;

  cfg.locks.prefix = std::move(raw.locks.prefix);
  cfg.locks.default_timeout =
      std::chrono::milliseconds{raw.locks.default_timeout_ms};

  cfg.executor.max_concurrency = raw.executor.max_concurrency;
  cfg.executor.lock_timeout =
      std::chrono::milliseconds{raw.executor.lock_timeout_ms};
  cfg.executor.deadlock_retries = raw.executor.deadlock_retries;
  cfg.executor.deadlock_backoff =
      std::chrono::milliseconds{raw.executor.deadlock_backoff_ms};
  cfg.executor.backpressure_threshold = raw.executor.backpressure_threshold;
  cfg.executor.history_size =
      static_cast<std::size_t>(std::max<int64_t>(raw.executor.history_size, 0));

  cfg.orchestrator.max_concurrent_tasks =
      raw.orchestrator.max_concurrent_tasks;
  cfg.orchestrator.retry_backoff =
      std::chrono::milliseconds{raw.orchestrator.retry_backoff_ms};
  cfg.orchestrator.shutdown_grace =
      std::chrono::seconds{raw.orchestrator.shutdown_grace_sec};
  cfg.orchestrator.history_size = static_cast<std::size_t>(
      std::max<int64_t>(raw.orchestrator.history_size, 0));

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);

  if (auto r = ConfigLoader::validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg) -> Result<void> {
  const auto &ex = cfg.executor;
  const auto &orch = cfg.orchestrator;
  if (cfg.database.pool_size == 0 || cfg.database.worker_threads == 0) {
    log::error("database.pool_size and database.worker_threads must be > 0");
    return fail(Error::ParseError);
  }
  if (cfg.locks.prefix.empty() || cfg.locks.default_timeout.count() <= 0) {
    log::error("locks.prefix must be set and locks.default_timeout_ms > 0");
    return fail(Error::ParseError);
  }
  if (ex.max_concurrency <= 0 || ex.lock_timeout.count() <= 0 ||
      ex.deadlock_retries < 0 || ex.deadlock_backoff.count() < 0 ||
      ex.backpressure_threshold <= 0.0 || ex.backpressure_threshold > 1.0 ||
      ex.history_size == 0) {
    log::error("invalid [executor] section");
    return fail(Error::ParseError);
  }
  if (orch.max_concurrent_tasks <= 0 || orch.retry_backoff.count() < 0 ||
      orch.shutdown_grace.count() < 0 || orch.history_size == 0) {
    log::error("invalid [orchestrator] section");
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid LOCKSTEP_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace lockstep
