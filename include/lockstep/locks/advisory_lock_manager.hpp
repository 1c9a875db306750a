#pragma once

#include "lockstep/config/system_config.hpp"
#include "lockstep/core/coroutine.hpp"
#include "lockstep/core/error.hpp"
#include "lockstep/db/connection.hpp"
#include "lockstep/util/enum.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lockstep {

enum class LockType : std::uint8_t { Exclusive, Shared };
BOOST_DESCRIBE_ENUM(LockType, Exclusive, Shared)
LOCKSTEP_DEFINE_ENUM_SERDE(LockType, LockType::Exclusive)

enum class LockEventKind : std::uint8_t { Attempt, Acquired, Released, Timeout };
BOOST_DESCRIBE_ENUM(LockEventKind, Attempt, Acquired, Released, Timeout)
LOCKSTEP_DEFINE_ENUM_SERDE(LockEventKind, LockEventKind::Attempt)

// Arguments of the two-integer advisory lock form.
struct TwoPartKey {
  std::int32_t key1{0};
  std::int32_t key2{0};

  auto operator==(const TwoPartKey &) const -> bool = default;
};

struct LockOptions {
  std::optional<std::chrono::milliseconds> timeout;
  // When set, the lock is taken as (hash(namespace), hash(identifier)).
  std::optional<std::string> two_part_namespace;
};

// Failure of a lock operation. `code` is a lockstep::Error (LockTimeout,
// LockFailed); `cause` carries the database error when there is one.
struct LockError {
  std::error_code code;
  std::int64_t lock_key{0};
  std::string identifier;
  std::chrono::milliseconds timeout{0};
  std::error_code cause;

  [[nodiscard]] auto message() const -> std::string;
};

template <typename T> using LockResult = std::expected<T, LockError>;

struct LockGrant {
  std::int64_t lock_key{0};
  bool acquired{false};
  std::string session_id;
};

struct LockRelease {
  std::int64_t lock_key{0};
  bool released{false};
  std::string session_id;
  std::chrono::milliseconds held_for{0};
};

// Row of pg_locks for the current backend.
struct SessionLock {
  std::int64_t lock_key{0}; // single-key form, or key1 of the two-part form
  std::int64_t obj_id{0};
  bool two_part{false};
  std::string mode;
  bool granted{false};
  bool fastpath{false};
  std::string session_id;
};

struct LockRecord {
  std::int64_t lock_key{0};
  std::string identifier;
  LockType type{LockType::Exclusive};
  std::string session_id;
  std::chrono::system_clock::time_point acquired_at;
  int hold_count{1};
};

struct LockDetail {
  LockRecord record;
  std::chrono::milliseconds held_for{0};
};

struct LockStatistics {
  std::size_t total_sessions{0};
  std::size_t total_locks{0};
  std::map<LockType, std::size_t> locks_by_type;
  std::vector<std::string> active_sessions;
};

struct LockEvent {
  LockEventKind kind{LockEventKind::Attempt};
  std::int64_t lock_key{0};
  std::string identifier;
  LockType type{LockType::Exclusive};
  std::string session_id;
  std::chrono::milliseconds elapsed{0};
};

// Coordinates PostgreSQL session-level advisory locks. Keys are hashed from
// identifiers so independent processes agree without coordination. The
// in-memory records mirror what this process acquired; pg_locks stays the
// authority and is what is_lock_held()/get_session_locks() consult.
//
// Re-acquiring a lock the session already holds succeeds immediately, as it
// does in PostgreSQL, and must be matched by one release per acquisition.
class AdvisoryLockManager {
public:
  using EventCallback = std::function<void(const LockEvent &)>;

  explicit AdvisoryLockManager(LockConfig config = {});

  [[nodiscard]] auto generate_lock_key(std::string_view identifier) const
      -> std::int64_t;
  // Both halves carry the manager prefix. Each is folded into the
  // non-negative int4 range the two-argument lock functions accept.
  [[nodiscard]] auto generate_two_part_key(std::string_view ns,
                                           std::string_view identifier) const
      -> TwoPartKey;

  [[nodiscard]] auto acquire_exclusive_lock(db::Connection &conn,
                                            std::string_view identifier,
                                            LockOptions options = {})
      -> task<LockResult<LockGrant>>;
  [[nodiscard]] auto acquire_shared_lock(db::Connection &conn,
                                         std::string_view identifier,
                                         LockOptions options = {})
      -> task<LockResult<LockGrant>>;
  [[nodiscard]] auto try_acquire_exclusive_lock(db::Connection &conn,
                                                std::string_view identifier,
                                                LockOptions options = {})
      -> task<LockResult<LockGrant>>;
  [[nodiscard]] auto try_acquire_shared_lock(db::Connection &conn,
                                             std::string_view identifier,
                                             LockOptions options = {})
      -> task<LockResult<LockGrant>>;

  [[nodiscard]] auto release_lock(db::Connection &conn,
                                  std::string_view identifier,
                                  LockOptions options = {},
                                  LockType type = LockType::Exclusive)
      -> task<LockResult<LockRelease>>;
  [[nodiscard]] auto release_all_locks(db::Connection &conn)
      -> task<LockResult<std::size_t>>;

  [[nodiscard]] auto is_lock_held(db::Connection &conn,
                                  std::string_view identifier,
                                  LockOptions options = {})
      -> task<LockResult<bool>>;
  [[nodiscard]] auto get_session_locks(db::Connection &conn)
      -> task<LockResult<std::vector<SessionLock>>>;

  [[nodiscard]] auto lock_statistics() const -> LockStatistics;
  [[nodiscard]] auto lock_details() const -> std::vector<LockDetail>;
  // Drops every in-memory record without touching the database.
  auto clear() -> void;

  auto on_event(EventCallback cb) -> void { on_event_ = std::move(cb); }

  [[nodiscard]] auto prefix() const noexcept -> const std::string & {
    return config_.prefix;
  }

private:
  // PostgreSQL counts shared and exclusive holds of one key separately.
  struct Slot {
    std::string session_id;
    std::int64_t key{0};
    bool two_part{false};
    LockType type{LockType::Exclusive};

    auto operator==(const Slot &) const -> bool = default;
  };

  struct SlotHash {
    using is_avalanching = void;
    auto operator()(const Slot &s) const noexcept -> std::uint64_t;
  };

  // Numeric key as tracked in memory, plus the SQL arguments.
  struct ResolvedKey {
    std::int64_t key{0};
    std::optional<TwoPartKey> parts;
  };

  [[nodiscard]] auto resolve(std::string_view identifier,
                             const LockOptions &options) const -> ResolvedKey;
  [[nodiscard]] auto acquire(db::Connection &conn, std::string_view identifier,
                             const LockOptions &options, LockType type,
                             bool wait) -> task<LockResult<LockGrant>>;
  [[nodiscard]] auto session_id(db::Connection &conn) -> task<std::string>;

  auto register_lock(const ResolvedKey &key, std::string_view identifier,
                     LockType type, const std::string &session) -> void;
  auto unregister_lock(const ResolvedKey &key, LockType type,
                       const std::string &session)
      -> std::optional<std::chrono::milliseconds>;
  auto emit(LockEventKind kind, std::int64_t key, std::string_view identifier,
            LockType type, const std::string &session,
            std::chrono::milliseconds elapsed = {}) -> void;

  LockConfig config_;
  ankerl::unordered_dense::map<Slot, LockRecord, SlotHash> records_;
  ankerl::unordered_dense::map<std::string, std::vector<Slot>> by_session_;
  EventCallback on_event_;
};

} // namespace lockstep
