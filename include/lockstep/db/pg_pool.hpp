#pragma once

#include "lockstep/config/system_config.hpp"
#include "lockstep/core/coroutine.hpp"
#include "lockstep/db/connection.hpp"

#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>

#include <pqxx/pqxx>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace lockstep::db {

[[nodiscard]] auto make_conninfo(const DatabaseConfig &cfg) -> std::string;

// A libpq session. Statements run on the pool's worker threads; a single
// connection must not be used by two coroutines at once.
class PgConnection final : public Connection {
public:
  PgConnection(std::unique_ptr<pqxx::connection> conn,
               boost::asio::thread_pool &workers);

  [[nodiscard]] auto query(std::string_view sql,
                           std::span<const Param> params = {})
      -> task<Result<QueryResult>> override;

  [[nodiscard]] auto is_open() const noexcept -> bool override;

private:
  [[nodiscard]] auto run(const std::string &sql,
                         const std::vector<Param> &params) -> Result<QueryResult>;

  std::unique_ptr<pqxx::connection> conn_;
  boost::asio::thread_pool &workers_;
  std::atomic<bool> open_{true};
};

// Bounded pool. Callers beyond capacity wait in FIFO order for a released
// connection, up to the connect timeout. State is touched only from the
// owning io_context thread; the pool must outlive every lease.
class PgPool final : public ConnectionPool {
public:
  explicit PgPool(const DatabaseConfig &cfg);
  ~PgPool() override;

  PgPool(const PgPool &) = delete;
  auto operator=(const PgPool &) -> PgPool & = delete;

  [[nodiscard]] auto acquire()
      -> task<Result<std::shared_ptr<Connection>>> override;
  auto release(std::shared_ptr<Connection> conn) -> void override;
  [[nodiscard]] auto stats() const -> PoolStats override;

  auto close() -> void;

private:
  using Signal = boost::asio::experimental::channel<void(
      boost::system::error_code)>;

  struct Waiter {
    explicit Waiter(boost::asio::any_io_executor ex) : signal(ex, 1) {}
    Signal signal;
    std::shared_ptr<Connection> conn;
    bool retry{false};
    bool abandoned{false};
  };

  [[nodiscard]] auto connect() -> task<Result<std::shared_ptr<Connection>>>;
  auto wake_for_retry() -> void;

  std::string conninfo_;
  std::size_t max_connections_;
  std::chrono::seconds acquire_timeout_;
  boost::asio::thread_pool workers_;
  std::vector<std::shared_ptr<Connection>> idle_;
  std::deque<std::shared_ptr<Waiter>> waiters_;
  std::size_t live_{0};
  std::size_t active_{0};
  bool closed_{false};
};

} // namespace lockstep::db
