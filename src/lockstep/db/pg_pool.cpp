#include "lockstep/db/pg_pool.hpp"
#include "lockstep/db/db_error.hpp"
#include "lockstep/util/log.hpp"

#include <boost/asio/steady_timer.hpp>

#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace lockstep::db {

namespace {

auto bind(pqxx::params &out, const Param &param) -> void {
  std::visit(
      [&out](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          out.append();
        } else {
          out.append(v);
        }
      },
      param);
}

auto convert(const pqxx::result &r) -> QueryResult {
  QueryResult out;
  out.affected_rows = static_cast<std::size_t>(r.affected_rows());
  out.columns.reserve(static_cast<std::size_t>(r.columns()));
  for (pqxx::row::size_type c = 0; c < r.columns(); ++c) {
    out.columns.emplace_back(r.column_name(c));
  }
  out.rows.reserve(static_cast<std::size_t>(r.size()));
  for (const auto &row : r) {
    Row converted;
    converted.cells.reserve(static_cast<std::size_t>(row.size()));
    for (const auto &field : row) {
      if (field.is_null()) {
        converted.cells.emplace_back(std::nullopt);
      } else {
        converted.cells.emplace_back(std::string{field.c_str()});
      }
    }
    out.rows.push_back(std::move(converted));
  }
  return out;
}

} // namespace

auto make_conninfo(const DatabaseConfig &cfg) -> std::string {
  if (!cfg.conninfo.empty()) {
    return cfg.conninfo;
  }
  auto out = std::format("host={} port={} user={} dbname={} connect_timeout={}",
                         cfg.host, cfg.port, cfg.username, cfg.database,
                         cfg.connect_timeout);
  if (!cfg.password.empty()) {
    out += std::format(" password={}", cfg.password);
  }
  return out;
}

PgConnection::PgConnection(std::unique_ptr<pqxx::connection> conn,
                           boost::asio::thread_pool &workers)
    : conn_(std::move(conn)), workers_(workers) {}

auto PgConnection::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

auto PgConnection::query(std::string_view sql, std::span<const Param> params)
    -> task<Result<QueryResult>> {
  if (!is_open()) {
    co_return fail(DbErrc::ConnectionFailed);
  }
  co_return co_await offload(
      workers_, [this, sql = std::string(sql),
                 params = std::vector<Param>(params.begin(), params.end())] {
        return run(sql, params);
      });
}

auto PgConnection::run(const std::string &sql, const std::vector<Param> &params)
    -> Result<QueryResult> {
  try {
    pqxx::nontransaction tx{*conn_};
    pqxx::params bound;
    for (const auto &p : params) {
      bind(bound, p);
    }
    return ok(convert(tx.exec_params(sql, bound)));
  } catch (const pqxx::broken_connection &e) {
    open_.store(false, std::memory_order_release);
    log::error("Database connection lost: {}", e.what());
    return fail(DbErrc::ConnectionFailed);
  } catch (const pqxx::sql_error &e) {
    auto code = from_sqlstate(e.sqlstate());
    log::debug("Statement failed [{}]: {}", e.sqlstate(), e.what());
    return fail(code);
  } catch (const std::exception &e) {
    log::error("Unexpected database failure: {}", e.what());
    return fail(DbErrc::QueryFailed);
  }
}

PgPool::PgPool(const DatabaseConfig &cfg)
    : conninfo_(make_conninfo(cfg)),
      max_connections_(cfg.pool_size == 0 ? 1 : cfg.pool_size),
      acquire_timeout_(cfg.connect_timeout),
      workers_(cfg.worker_threads == 0 ? 1 : cfg.worker_threads) {}

PgPool::~PgPool() {
  close();
  workers_.join();
}

auto PgPool::connect() -> task<Result<std::shared_ptr<Connection>>> {
  auto raw = co_await offload(
      workers_,
      [conninfo = conninfo_]() -> Result<std::unique_ptr<pqxx::connection>> {
        try {
          return ok(std::make_unique<pqxx::connection>(conninfo));
        } catch (const pqxx::broken_connection &e) {
          log::error("Failed to connect to PostgreSQL: {}", e.what());
          return fail(DbErrc::ConnectionFailed);
        } catch (const std::exception &e) {
          log::error("Failed to connect to PostgreSQL: {}", e.what());
          return fail(DbErrc::ConnectionFailed);
        }
      });
  if (!raw) {
    co_return fail(raw.error());
  }
  co_return ok(std::static_pointer_cast<Connection>(
      std::make_shared<PgConnection>(std::move(*raw), workers_)));
}

auto PgPool::acquire() -> task<Result<std::shared_ptr<Connection>>> {
  using namespace awaitable_ops;
  for (;;) {
    if (closed_) {
      co_return fail(DbErrc::PoolClosed);
    }
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      ++active_;
      co_return ok(std::move(conn));
    }
    if (live_ < max_connections_) {
      ++live_;
      ++active_;
      auto conn = co_await connect();
      if (!conn) {
        --live_;
        --active_;
        wake_for_retry();
        co_return fail(conn.error());
      }
      log::debug("Opened database connection ({}/{})", live_,
                 max_connections_);
      co_return conn;
    }

    auto waiter =
        std::make_shared<Waiter>(co_await boost::asio::this_coro::executor);
    waiters_.push_back(waiter);
    boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
    timer.expires_after(acquire_timeout_);
    [[maybe_unused]] auto outcome =
        co_await (waiter->signal.async_receive(use_nothrow) ||
                  timer.async_wait(use_nothrow));

    // A hand-off may land in the same tick as the timeout; honour it.
    if (waiter->conn) {
      co_return ok(std::move(waiter->conn));
    }
    if (waiter->retry) {
      continue;
    }
    waiter->abandoned = true;
    log::warn("Timed out after {}s waiting for a database connection",
              acquire_timeout_.count());
    co_return fail(DbErrc::PoolExhausted);
  }
}

auto PgPool::release(std::shared_ptr<Connection> conn) -> void {
  if (!conn) {
    return;
  }
  --active_;
  if (closed_ || !conn->is_open()) {
    --live_;
    wake_for_retry();
    return;
  }
  while (!waiters_.empty()) {
    auto waiter = std::move(waiters_.front());
    waiters_.pop_front();
    if (waiter->abandoned) {
      continue;
    }
    ++active_;
    waiter->conn = std::move(conn);
    (void)waiter->signal.try_send(boost::system::error_code{});
    return;
  }
  idle_.push_back(std::move(conn));
}

auto PgPool::stats() const -> PoolStats {
  return {.active = active_, .total = max_connections_};
}

auto PgPool::close() -> void {
  if (closed_) {
    return;
  }
  closed_ = true;
  live_ -= idle_.size();
  idle_.clear();
  while (!waiters_.empty()) {
    wake_for_retry();
  }
}

// Capacity freed without a connection to hand over: let the oldest waiter
// loop back and open one itself.
auto PgPool::wake_for_retry() -> void {
  while (!waiters_.empty()) {
    auto waiter = std::move(waiters_.front());
    waiters_.pop_front();
    if (waiter->abandoned) {
      continue;
    }
    waiter->retry = true;
    (void)waiter->signal.try_send(boost::system::error_code{});
    return;
  }
}

} // namespace lockstep::db
