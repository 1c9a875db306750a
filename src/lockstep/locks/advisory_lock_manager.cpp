#include "lockstep/locks/advisory_lock_manager.hpp"

#include "lockstep/db/db_error.hpp"
#include "lockstep/util/log.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <functional>
#include <limits>
#include <ranges>
#include <utility>

namespace lockstep {

namespace {

constexpr std::string_view kShowLockTimeout =
    "SELECT current_setting('lock_timeout')";
constexpr std::string_view kSetLockTimeout =
    "SELECT set_config('lock_timeout', $1, false)";

// Java-style string hash (h * 31 + c) wrapped to 32 bits.
auto hash32(std::string_view text) noexcept -> std::int32_t {
  std::uint32_t h = 0;
  for (unsigned char c : text) {
    h = h * 31U + c;
  }
  return static_cast<std::int32_t>(h);
}

auto lock_sql(LockType type, bool two_part, bool wait) -> std::string_view {
  static constexpr std::array<std::string_view, 8> statements = {
      "SELECT pg_try_advisory_lock($1::bigint)",
      "SELECT pg_try_advisory_lock_shared($1::bigint)",
      "SELECT pg_try_advisory_lock($1::integer, $2::integer)",
      "SELECT pg_try_advisory_lock_shared($1::integer, $2::integer)",
      "SELECT pg_advisory_lock($1::bigint)",
      "SELECT pg_advisory_lock_shared($1::bigint)",
      "SELECT pg_advisory_lock($1::integer, $2::integer)",
      "SELECT pg_advisory_lock_shared($1::integer, $2::integer)",
  };
  const auto idx = (wait ? 4U : 0U) + (two_part ? 2U : 0U) +
                   (type == LockType::Shared ? 1U : 0U);
  return statements.at(idx);
}

auto unlock_sql(LockType type, bool two_part) -> std::string_view {
  if (two_part) {
    return type == LockType::Shared
               ? "SELECT pg_advisory_unlock_shared($1::integer, $2::integer)"
               : "SELECT pg_advisory_unlock($1::integer, $2::integer)";
  }
  return type == LockType::Shared
             ? "SELECT pg_advisory_unlock_shared($1::bigint)"
             : "SELECT pg_advisory_unlock($1::bigint)";
}

auto first_bool(const db::QueryResult &r) -> bool {
  return !r.rows.empty() && r.rows.front().as_bool(0).value_or(false);
}

} // namespace

auto LockError::message() const -> std::string {
  if (code == make_error_code(Error::LockTimeout)) {
    return std::format("failed to acquire lock on {} (key {}) within {}ms",
                       identifier, lock_key, timeout.count());
  }
  if (cause) {
    return std::format("{} on {} (key {}): {}", code.message(), identifier,
                       lock_key, cause.message());
  }
  return std::format("{} on {} (key {})", code.message(), identifier,
                     lock_key);
}

AdvisoryLockManager::AdvisoryLockManager(LockConfig config)
    : config_(std::move(config)) {}

auto AdvisoryLockManager::SlotHash::operator()(const Slot &s) const noexcept
    -> std::uint64_t {
  auto h = ankerl::unordered_dense::hash<std::string>{}(s.session_id);
  h ^= static_cast<std::uint64_t>(s.key) + 0x9e3779b97f4a7c15ULL + (h << 6) +
       (h >> 2);
  h ^= static_cast<std::uint64_t>(std::to_underlying(s.type)) << 1;
  return s.two_part ? ~h : h;
}

auto AdvisoryLockManager::generate_lock_key(std::string_view identifier) const
    -> std::int64_t {
  const auto full = std::format("{}:{}", config_.prefix, identifier);
  const auto h = static_cast<std::int64_t>(hash32(full));
  return h < 0 ? -h : h;
}

auto AdvisoryLockManager::generate_two_part_key(std::string_view ns,
                                                std::string_view identifier)
    const -> TwoPartKey {
  // abs(INT32_MIN) does not fit int4; masking sends it to 0.
  auto fold = [](std::int64_t k) {
    return static_cast<std::int32_t>(k & std::numeric_limits<std::int32_t>::max());
  };
  return {fold(generate_lock_key(ns)), fold(generate_lock_key(identifier))};
}

auto AdvisoryLockManager::resolve(std::string_view identifier,
                                  const LockOptions &options) const
    -> ResolvedKey {
  if (!options.two_part_namespace) {
    return {generate_lock_key(identifier), std::nullopt};
  }
  auto parts = generate_two_part_key(*options.two_part_namespace, identifier);
  const auto packed = (static_cast<std::int64_t>(parts.key1) << 32) |
                      static_cast<std::uint32_t>(parts.key2);
  return {packed, parts};
}

auto AdvisoryLockManager::session_id(db::Connection &conn)
    -> task<std::string> {
  auto r = co_await conn.query("SELECT pg_backend_pid()");
  if (!r || r->rows.empty() || r->rows.front().is_null(0)) {
    log::warn("Could not determine backend pid for advisory lock session");
    co_return std::string{"unknown"};
  }
  co_return std::string{r->rows.front().text(0)};
}

auto AdvisoryLockManager::acquire_exclusive_lock(db::Connection &conn,
                                                 std::string_view identifier,
                                                 LockOptions options)
    -> task<LockResult<LockGrant>> {
  co_return co_await acquire(conn, identifier, options, LockType::Exclusive,
                             true);
}

auto AdvisoryLockManager::acquire_shared_lock(db::Connection &conn,
                                              std::string_view identifier,
                                              LockOptions options)
    -> task<LockResult<LockGrant>> {
  co_return co_await acquire(conn, identifier, options, LockType::Shared,
                             true);
}

auto AdvisoryLockManager::try_acquire_exclusive_lock(
    db::Connection &conn, std::string_view identifier, LockOptions options)
    -> task<LockResult<LockGrant>> {
  co_return co_await acquire(conn, identifier, options, LockType::Exclusive,
                             false);
}

auto AdvisoryLockManager::try_acquire_shared_lock(db::Connection &conn,
                                                  std::string_view identifier,
                                                  LockOptions options)
    -> task<LockResult<LockGrant>> {
  co_return co_await acquire(conn, identifier, options, LockType::Shared,
                             false);
}

auto AdvisoryLockManager::acquire(db::Connection &conn,
                                  std::string_view identifier,
                                  const LockOptions &options, LockType type,
                                  bool wait) -> task<LockResult<LockGrant>> {
  const auto key = resolve(identifier, options);
  const auto timeout = options.timeout.value_or(config_.default_timeout);
  const auto session = co_await session_id(conn);
  const auto started = std::chrono::steady_clock::now();

  auto failure = [&](Error code, std::error_code cause = {}) {
    return std::unexpected{LockError{make_error_code(code), key.key,
                                     std::string{identifier}, timeout, cause}};
  };

  emit(LockEventKind::Attempt, key.key, identifier, type, session);

  std::vector<db::Param> params;
  if (key.parts) {
    params = {std::int64_t{key.parts->key1}, std::int64_t{key.parts->key2}};
  } else {
    params = {key.key};
  }
  const auto sql = lock_sql(type, key.parts.has_value(), wait);

  if (!wait) {
    auto r = co_await conn.query(sql, params);
    if (!r) {
      log::error("Failed to try {} lock on {}: {}", to_string_view(type),
                 identifier, r.error().message());
      co_return failure(Error::LockFailed, r.error());
    }
    const bool acquired = first_bool(*r);
    if (acquired) {
      register_lock(key, identifier, type, session);
      emit(LockEventKind::Acquired, key.key, identifier, type, session);
    }
    co_return LockGrant{key.key, acquired, session};
  }

  // The blocking wait is bounded server-side, so the backend stops waiting
  // when the deadline passes. The session's previous setting is restored.
  auto previous = co_await conn.query(kShowLockTimeout);
  if (!previous) {
    co_return failure(Error::LockFailed, previous.error());
  }
  const auto restore =
      previous->rows.empty() ? std::string{"0"}
                             : std::string{previous->rows.front().text(0)};

  const std::array<db::Param, 1> limit{std::format("{}ms", timeout.count())};
  if (auto set = co_await conn.query(kSetLockTimeout, limit); !set) {
    co_return failure(Error::LockFailed, set.error());
  }

  auto r = co_await conn.query(sql, params);

  const std::array<db::Param, 1> reset{restore};
  if (auto back = co_await conn.query(kSetLockTimeout, reset); !back) {
    log::warn("Could not restore lock_timeout after locking {}: {}",
              identifier, back.error().message());
  }

  if (!r) {
    if (db::is_lock_timeout(r.error())) {
      emit(LockEventKind::Timeout, key.key, identifier, type, session,
           std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - started));
      log::warn("Timed out after {}ms waiting for {} lock on {}",
                timeout.count(), to_string_view(type), identifier);
      co_return failure(Error::LockTimeout, r.error());
    }
    log::error("Failed to acquire {} lock on {}: {}", to_string_view(type),
               identifier, r.error().message());
    co_return failure(Error::LockFailed, r.error());
  }

  register_lock(key, identifier, type, session);
  emit(LockEventKind::Acquired, key.key, identifier, type, session,
       std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::steady_clock::now() - started));
  log::debug("Acquired {} lock on {} (key {}, session {})",
             to_string_view(type), identifier, key.key, session);
  co_return LockGrant{key.key, true, session};
}

auto AdvisoryLockManager::release_lock(db::Connection &conn,
                                       std::string_view identifier,
                                       LockOptions options, LockType type)
    -> task<LockResult<LockRelease>> {
  const auto key = resolve(identifier, options);
  const auto session = co_await session_id(conn);

  std::vector<db::Param> params;
  if (key.parts) {
    params = {std::int64_t{key.parts->key1}, std::int64_t{key.parts->key2}};
  } else {
    params = {key.key};
  }

  auto r = co_await conn.query(unlock_sql(type, key.parts.has_value()),
                               params);
  if (!r) {
    co_return std::unexpected{LockError{make_error_code(Error::LockFailed),
                                        key.key, std::string{identifier},
                                        std::chrono::milliseconds{0},
                                        r.error()}};
  }

  LockRelease out{key.key, first_bool(*r), session, {}};
  if (!out.released) {
    log::debug("Lock on {} (key {}) was not held by session {}", identifier,
               key.key, session);
    co_return out;
  }
  out.held_for = unregister_lock(key, type, session).value_or(
      std::chrono::milliseconds{0});
  emit(LockEventKind::Released, key.key, identifier, type, session,
       out.held_for);
  co_return out;
}

auto AdvisoryLockManager::release_all_locks(db::Connection &conn)
    -> task<LockResult<std::size_t>> {
  const auto session = co_await session_id(conn);
  auto r = co_await conn.query("SELECT pg_advisory_unlock_all()");
  if (!r) {
    co_return std::unexpected{LockError{make_error_code(Error::LockFailed), 0,
                                        {}, std::chrono::milliseconds{0},
                                        r.error()}};
  }

  std::size_t released = 0;
  if (auto it = by_session_.find(session); it != by_session_.end()) {
    for (const auto &slot : it->second) {
      if (auto rec = records_.find(slot); rec != records_.end()) {
        emit(LockEventKind::Released, rec->second.lock_key,
             rec->second.identifier, rec->second.type, session);
        records_.erase(rec);
        ++released;
      }
    }
    by_session_.erase(it);
  }
  log::debug("Released {} advisory lock(s) for session {}", released,
             session);
  co_return released;
}

auto AdvisoryLockManager::is_lock_held(db::Connection &conn,
                                       std::string_view identifier,
                                       LockOptions options)
    -> task<LockResult<bool>> {
  const auto key = resolve(identifier, options);

  // A bigint key is stored as (high 32 bits, low 32 bits, 1); the two-part
  // form as (key1, key2, 2).
  constexpr std::string_view sql =
      "SELECT EXISTS (SELECT 1 FROM pg_locks WHERE locktype = 'advisory' "
      "AND granted AND classid::bigint = $1 AND objid::bigint = $2 "
      "AND objsubid = $3)";
  std::array<db::Param, 3> params;
  if (key.parts) {
    params = {std::int64_t{key.parts->key1}, std::int64_t{key.parts->key2},
              std::int64_t{2}};
  } else {
    params = {std::int64_t{key.key >> 32},
              static_cast<std::int64_t>(key.key & 0xffffffff), std::int64_t{1}};
  }

  auto r = co_await conn.query(sql, params);
  if (!r) {
    co_return std::unexpected{LockError{make_error_code(Error::LockFailed),
                                        key.key, std::string{identifier},
                                        std::chrono::milliseconds{0},
                                        r.error()}};
  }
  co_return first_bool(*r);
}

auto AdvisoryLockManager::get_session_locks(db::Connection &conn)
    -> task<LockResult<std::vector<SessionLock>>> {
  const auto session = co_await session_id(conn);
  auto r = co_await conn.query(
      "SELECT classid, objid, objsubid, mode, granted, fastpath "
      "FROM pg_locks WHERE locktype = 'advisory' AND pid = pg_backend_pid() "
      "ORDER BY classid, objid");
  if (!r) {
    co_return std::unexpected{LockError{make_error_code(Error::LockFailed), 0,
                                        {}, std::chrono::milliseconds{0},
                                        r.error()}};
  }

  std::vector<SessionLock> out;
  out.reserve(r->rows.size());
  for (const auto &row : r->rows) {
    SessionLock lock;
    const auto classid = row.as_int64(0).value_or(0);
    const auto objid = row.as_int64(1).value_or(0);
    lock.two_part = row.as_int64(2).value_or(1) == 2;
    lock.lock_key = lock.two_part ? classid : (classid << 32) | objid;
    lock.obj_id = objid;
    lock.mode = std::string{row.text(3)};
    lock.granted = row.as_bool(4).value_or(false);
    lock.fastpath = row.as_bool(5).value_or(false);
    lock.session_id = session;
    out.push_back(std::move(lock));
  }
  co_return out;
}

auto AdvisoryLockManager::register_lock(const ResolvedKey &key,
                                        std::string_view identifier,
                                        LockType type,
                                        const std::string &session) -> void {
  Slot slot{session, key.key, key.parts.has_value(), type};
  if (auto it = records_.find(slot); it != records_.end()) {
    ++it->second.hold_count;
    return;
  }
  records_.emplace(slot, LockRecord{key.key, std::string{identifier}, type,
                                    session, std::chrono::system_clock::now(),
                                    1});
  by_session_[session].push_back(std::move(slot));
}

auto AdvisoryLockManager::unregister_lock(const ResolvedKey &key,
                                          LockType type,
                                          const std::string &session)
    -> std::optional<std::chrono::milliseconds> {
  Slot slot{session, key.key, key.parts.has_value(), type};
  auto it = records_.find(slot);
  if (it == records_.end()) {
    return std::nullopt;
  }
  auto held = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now() - it->second.acquired_at);
  if (--it->second.hold_count > 0) {
    return held;
  }
  records_.erase(it);
  if (auto s = by_session_.find(session); s != by_session_.end()) {
    std::erase(s->second, slot);
    if (s->second.empty()) {
      by_session_.erase(s);
    }
  }
  return held;
}

auto AdvisoryLockManager::emit(LockEventKind kind, std::int64_t key,
                               std::string_view identifier, LockType type,
                               const std::string &session,
                               std::chrono::milliseconds elapsed) -> void {
  if (!on_event_) {
    return;
  }
  on_event_(LockEvent{kind, key, std::string{identifier}, type, session,
                      elapsed});
}

auto AdvisoryLockManager::lock_statistics() const -> LockStatistics {
  LockStatistics stats;
  stats.total_sessions = by_session_.size();
  stats.total_locks = records_.size();
  for (const auto &[slot, record] : records_) {
    ++stats.locks_by_type[record.type];
  }
  for (const auto &[session, slots] : by_session_) {
    stats.active_sessions.push_back(session);
  }
  std::ranges::sort(stats.active_sessions);
  return stats;
}

auto AdvisoryLockManager::lock_details() const -> std::vector<LockDetail> {
  const auto now = std::chrono::system_clock::now();
  std::vector<LockDetail> out;
  out.reserve(records_.size());
  for (const auto &[slot, record] : records_) {
    out.push_back({record, std::chrono::duration_cast<std::chrono::milliseconds>(
                               now - record.acquired_at)});
  }
  std::ranges::sort(out, std::greater<>{},
                    [](const LockDetail &d) { return d.held_for; });
  return out;
}

auto AdvisoryLockManager::clear() -> void {
  records_.clear();
  by_session_.clear();
}

} // namespace lockstep
