#pragma once

#include "lockstep/core/coroutine.hpp"
#include "lockstep/core/error.hpp"
#include "lockstep/db/types.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>

namespace lockstep::db {

// One database session. Advisory locks and `SET` state belong to the
// session, so callers keep a connection for as long as they rely on either.
class Connection {
public:
  virtual ~Connection() = default;

  [[nodiscard]] virtual auto query(std::string_view sql,
                                   std::span<const Param> params = {})
      -> task<Result<QueryResult>> = 0;

  // False once the session is known to be unusable; the pool drops it.
  [[nodiscard]] virtual auto is_open() const noexcept -> bool { return true; }
};

struct PoolStats {
  std::size_t active{0}; // connections handed out
  std::size_t total{0};  // pool capacity

  [[nodiscard]] auto utilization() const noexcept -> double {
    return total == 0 ? 0.0
                      : static_cast<double>(active) /
                            static_cast<double>(total);
  }
};

class ConnectionPool {
public:
  virtual ~ConnectionPool() = default;

  [[nodiscard]] virtual auto acquire()
      -> task<Result<std::shared_ptr<Connection>>> = 0;
  virtual auto release(std::shared_ptr<Connection> conn) -> void = 0;
  [[nodiscard]] virtual auto stats() const -> PoolStats = 0;
};

// Returns the connection to its pool when the scope ends.
class ConnectionLease {
public:
  ConnectionLease(ConnectionPool &pool, std::shared_ptr<Connection> conn)
      : pool_(&pool), conn_(std::move(conn)) {}

  ~ConnectionLease() {
    if (conn_) {
      pool_->release(std::move(conn_));
    }
  }

  ConnectionLease(const ConnectionLease &) = delete;
  auto operator=(const ConnectionLease &) -> ConnectionLease & = delete;

  [[nodiscard]] auto operator->() const noexcept -> Connection * {
    return conn_.get();
  }
  [[nodiscard]] auto operator*() const noexcept -> Connection & {
    return *conn_;
  }

private:
  ConnectionPool *pool_;
  std::shared_ptr<Connection> conn_;
};

} // namespace lockstep::db
