#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lockstep {

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{5432};
  std::string username{"lockstep"};
  std::string password;
  std::string database{"lockstep"};
  std::string conninfo; // overrides the discrete fields when set
  uint16_t pool_size{4};
  uint16_t connect_timeout{5}; // seconds
  uint16_t worker_threads{2};  // threads running blocking libpq calls

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct LockConfig {
  std::string prefix{"lockstep"};
  std::chrono::milliseconds default_timeout{30000};

  auto operator==(const LockConfig &) const -> bool = default;
};

struct ExecutorConfig {
  int max_concurrency{4};
  std::chrono::milliseconds lock_timeout{30000};
  int deadlock_retries{3};
  std::chrono::milliseconds deadlock_backoff{1000}; // doubled per retry
  double backpressure_threshold{0.8};
  std::size_t history_size{1000};

  auto operator==(const ExecutorConfig &) const -> bool = default;
};

struct OrchestratorConfig {
  int max_concurrent_tasks{3};
  std::chrono::milliseconds retry_backoff{1000}; // doubled per retry
  std::chrono::seconds shutdown_grace{30};
  std::chrono::milliseconds shutdown_poll{100};
  std::size_t history_size{1000};

  auto operator==(const OrchestratorConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  LockConfig locks;
  ExecutorConfig executor;
  OrchestratorConfig orchestrator;
  LogConfig log;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace lockstep
