#include "lockstep/locks/advisory_lock_manager.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace lockstep;
using namespace std::chrono_literals;

namespace {

auto contains(std::string_view haystack, std::string_view needle) -> bool {
  return haystack.find(needle) != std::string_view::npos;
}

// Minimal PostgreSQL stand-in for advisory lock calls.
struct FakeServer {
  bool try_lock_result{true};
  bool unlock_result{true};
  bool held_result{true};
  std::error_code lock_error;
  std::string previous_timeout{"5s"};

  auto handler() -> test::FakeConnection::Handler {
    return [this](std::string_view sql,
                  std::span<const db::Param>) -> Result<db::QueryResult> {
      if (contains(sql, "pg_backend_pid()") && !contains(sql, "pg_locks")) {
        return test::single_value("4242");
      }
      if (contains(sql, "current_setting")) {
        return test::single_value(previous_timeout);
      }
      if (contains(sql, "set_config")) {
        return test::single_value("ok");
      }
      if (contains(sql, "pg_try_advisory_lock")) {
        return test::single_value(try_lock_result ? "t" : "f");
      }
      if (contains(sql, "pg_advisory_lock")) {
        if (lock_error) {
          return fail(lock_error);
        }
        return test::single_value("");
      }
      if (contains(sql, "pg_advisory_unlock_all")) {
        return test::single_value("");
      }
      if (contains(sql, "pg_advisory_unlock")) {
        return test::single_value(unlock_result ? "t" : "f");
      }
      if (contains(sql, "EXISTS")) {
        return test::single_value(held_result ? "t" : "f");
      }
      if (contains(sql, "FROM pg_locks")) {
        db::QueryResult r;
        r.columns = {"classid", "objid", "objsubid", "mode", "granted",
                     "fastpath"};
        r.rows.push_back(db::Row{{db::Cell{"0"}, db::Cell{"1234"},
                                  db::Cell{"1"}, db::Cell{"ExclusiveLock"},
                                  db::Cell{"t"}, db::Cell{"f"}}});
        r.rows.push_back(db::Row{{db::Cell{"7"}, db::Cell{"9"}, db::Cell{"2"},
                                  db::Cell{"ShareLock"}, db::Cell{"t"},
                                  db::Cell{"t"}}});
        return r;
      }
      return db::QueryResult{};
    };
  }
};

} // namespace

class AdvisoryLockManagerTest : public ::testing::Test {
protected:
  AdvisoryLockManagerTest()
      : conn_(std::make_shared<test::FakeConnection>(server_.handler())) {}

  FakeServer server_;
  std::shared_ptr<test::FakeConnection> conn_;
  AdvisoryLockManager manager_{LockConfig{"lockstep", 2000ms}};
};

TEST(AdvisoryLockKeyTest, MatchesStringHashOfPrefixedIdentifier) {
  AdvisoryLockManager manager{LockConfig{"p", 1000ms}};
  // ((('p' * 31) + ':') * 31) + 'a'
  EXPECT_EQ(manager.generate_lock_key("a"), 109527);
}

TEST(AdvisoryLockKeyTest, KeysAreDeterministicAndNonNegative) {
  AdvisoryLockManager manager;
  for (const char *id :
       {"migration:users", "run:schema-v2", "", "a much longer identifier "
                                                "that overflows 32 bits"}) {
    const auto key = manager.generate_lock_key(id);
    EXPECT_GE(key, 0) << id;
    EXPECT_EQ(key, manager.generate_lock_key(id)) << id;
  }
  EXPECT_NE(manager.generate_lock_key("users"),
            manager.generate_lock_key("orders"));
}

TEST(AdvisoryLockKeyTest, PrefixSeparatesNamespaces) {
  AdvisoryLockManager a{LockConfig{"app_a", 1000ms}};
  AdvisoryLockManager b{LockConfig{"app_b", 1000ms}};
  EXPECT_NE(a.generate_lock_key("users"), b.generate_lock_key("users"));
}

TEST(AdvisoryLockKeyTest, TwoPartKeysFitInt4) {
  AdvisoryLockManager manager;
  auto key = manager.generate_two_part_key("tenant_42", "users");
  EXPECT_GE(key.key1, 0);
  EXPECT_GE(key.key2, 0);
  EXPECT_EQ(key, manager.generate_two_part_key("tenant_42", "users"));
  EXPECT_NE(key, manager.generate_two_part_key("tenant_43", "users"));
}

TEST(AdvisoryLockKeyTest, TwoPartKeyHalvesAreIndependent) {
  AdvisoryLockManager manager;
  // key1 follows the namespace alone, key2 the identifier alone.
  EXPECT_EQ(manager.generate_two_part_key("ns", "a").key1,
            manager.generate_two_part_key("ns", "b").key1);
  EXPECT_EQ(manager.generate_two_part_key("n1", "id").key2,
            manager.generate_two_part_key("n2", "id").key2);
  EXPECT_NE(manager.generate_two_part_key("n1", "id").key1,
            manager.generate_two_part_key("n2", "id").key1);
}

TEST_F(AdvisoryLockManagerTest, BlockingAcquireSetsAndRestoresTimeout) {
  std::vector<LockEvent> events;
  manager_.on_event([&](const LockEvent &e) { events.push_back(e); });

  auto grant = test::run_coro(
      manager_.acquire_exclusive_lock(*conn_, "migration", {500ms, {}}));
  ASSERT_TRUE(grant.has_value()) << grant.error().message();
  EXPECT_TRUE(grant->acquired);
  EXPECT_EQ(grant->session_id, "4242");
  EXPECT_EQ(grant->lock_key, manager_.generate_lock_key("migration"));

  auto sets = conn_->calls_with("set_config");
  ASSERT_EQ(sets.size(), 2U);
  EXPECT_EQ(std::get<std::string>(sets[0].params.at(0)), "500ms");
  EXPECT_EQ(std::get<std::string>(sets[1].params.at(0)), "5s");

  auto locks = conn_->calls_with("pg_advisory_lock(");
  ASSERT_EQ(locks.size(), 1U);
  EXPECT_EQ(std::get<std::int64_t>(locks[0].params.at(0)), grant->lock_key);

  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(events[0].kind, LockEventKind::Attempt);
  EXPECT_EQ(events[1].kind, LockEventKind::Acquired);
  EXPECT_EQ(events[1].identifier, "migration");
}

TEST_F(AdvisoryLockManagerTest, DefaultTimeoutComesFromConfig) {
  auto grant =
      test::run_coro(manager_.acquire_shared_lock(*conn_, "catalog"));
  ASSERT_TRUE(grant.has_value());
  auto sets = conn_->calls_with("set_config");
  ASSERT_FALSE(sets.empty());
  EXPECT_EQ(std::get<std::string>(sets[0].params.at(0)), "2000ms");
  EXPECT_EQ(conn_->calls_with("pg_advisory_lock_shared(").size(), 1U);
  EXPECT_EQ(manager_.lock_statistics().locks_by_type[LockType::Shared], 1U);
}

TEST_F(AdvisoryLockManagerTest, TimeoutIsReportedAsLockTimeout) {
  server_.lock_error = make_error_code(db::DbErrc::LockNotAvailable);
  std::vector<LockEventKind> kinds;
  manager_.on_event([&](const LockEvent &e) { kinds.push_back(e.kind); });

  auto grant = test::run_coro(
      manager_.acquire_exclusive_lock(*conn_, "busy", {100ms, {}}));
  ASSERT_FALSE(grant.has_value());
  EXPECT_EQ(grant.error().code, make_error_code(Error::LockTimeout));
  EXPECT_EQ(grant.error().identifier, "busy");
  EXPECT_EQ(grant.error().timeout, 100ms);
  EXPECT_EQ(grant.error().lock_key, manager_.generate_lock_key("busy"));
  EXPECT_NE(grant.error().message().find("within 100ms"), std::string::npos);

  // The previous setting is restored even when the lock is not granted.
  EXPECT_EQ(conn_->calls_with("set_config").size(), 2U);
  EXPECT_EQ(kinds, (std::vector<LockEventKind>{LockEventKind::Attempt,
                                               LockEventKind::Timeout}));
  EXPECT_EQ(manager_.lock_statistics().total_locks, 0U);
}

TEST_F(AdvisoryLockManagerTest, OtherFailuresAreLockFailed) {
  server_.lock_error = make_error_code(db::DbErrc::ConnectionFailed);
  auto grant =
      test::run_coro(manager_.acquire_exclusive_lock(*conn_, "broken"));
  ASSERT_FALSE(grant.has_value());
  EXPECT_EQ(grant.error().code, make_error_code(Error::LockFailed));
  EXPECT_EQ(grant.error().cause, make_error_code(db::DbErrc::ConnectionFailed));
}

TEST_F(AdvisoryLockManagerTest, TryAcquireReportsContention) {
  server_.try_lock_result = false;
  auto grant =
      test::run_coro(manager_.try_acquire_exclusive_lock(*conn_, "busy"));
  ASSERT_TRUE(grant.has_value());
  EXPECT_FALSE(grant->acquired);
  EXPECT_TRUE(conn_->calls_with("set_config").empty());
  EXPECT_EQ(manager_.lock_statistics().total_locks, 0U);

  server_.try_lock_result = true;
  grant = test::run_coro(manager_.try_acquire_shared_lock(*conn_, "busy"));
  ASSERT_TRUE(grant.has_value());
  EXPECT_TRUE(grant->acquired);
  EXPECT_EQ(conn_->calls_with("pg_try_advisory_lock_shared").size(), 1U);
}

TEST_F(AdvisoryLockManagerTest, TwoPartLocksUseIntegerPair) {
  LockOptions opts{std::nullopt, std::string{"tenant_7"}};
  auto grant =
      test::run_coro(manager_.try_acquire_exclusive_lock(*conn_, "users", opts));
  ASSERT_TRUE(grant.has_value());
  ASSERT_TRUE(grant->acquired);

  const auto parts = manager_.generate_two_part_key("tenant_7", "users");
  auto calls = conn_->calls_with("pg_try_advisory_lock($1::integer");
  ASSERT_EQ(calls.size(), 1U);
  ASSERT_EQ(calls[0].params.size(), 2U);
  EXPECT_EQ(std::get<std::int64_t>(calls[0].params[0]), parts.key1);
  EXPECT_EQ(std::get<std::int64_t>(calls[0].params[1]), parts.key2);

  auto released = test::run_coro(manager_.release_lock(*conn_, "users", opts));
  ASSERT_TRUE(released.has_value());
  EXPECT_TRUE(released->released);
  EXPECT_EQ(conn_->calls_with("pg_advisory_unlock($1::integer").size(), 1U);
}

TEST_F(AdvisoryLockManagerTest, ReentrantAcquireNeedsMatchingReleases) {
  ASSERT_TRUE(
      test::run_coro(manager_.try_acquire_exclusive_lock(*conn_, "job"))
          ->acquired);
  ASSERT_TRUE(
      test::run_coro(manager_.try_acquire_exclusive_lock(*conn_, "job"))
          ->acquired);

  auto details = manager_.lock_details();
  ASSERT_EQ(details.size(), 1U);
  EXPECT_EQ(details.front().record.hold_count, 2);

  ASSERT_TRUE(test::run_coro(manager_.release_lock(*conn_, "job")).has_value());
  EXPECT_EQ(manager_.lock_statistics().total_locks, 1U);
  ASSERT_TRUE(test::run_coro(manager_.release_lock(*conn_, "job")).has_value());
  EXPECT_EQ(manager_.lock_statistics().total_locks, 0U);
  EXPECT_EQ(manager_.lock_statistics().total_sessions, 0U);
}

TEST_F(AdvisoryLockManagerTest, SharedAndExclusiveHoldsAreTrackedApart) {
  ASSERT_TRUE(test::run_coro(manager_.acquire_exclusive_lock(*conn_, "job")));
  ASSERT_TRUE(test::run_coro(manager_.acquire_shared_lock(*conn_, "job")));

  auto stats = manager_.lock_statistics();
  EXPECT_EQ(stats.total_locks, 2U);
  EXPECT_EQ(stats.locks_by_type[LockType::Exclusive], 1U);
  EXPECT_EQ(stats.locks_by_type[LockType::Shared], 1U);

  ASSERT_TRUE(test::run_coro(
      manager_.release_lock(*conn_, "job", {}, LockType::Shared)));
  stats = manager_.lock_statistics();
  EXPECT_EQ(stats.total_locks, 1U);
  EXPECT_EQ(stats.locks_by_type[LockType::Exclusive], 1U);
  EXPECT_EQ(stats.locks_by_type.count(LockType::Shared), 0U);

  auto details = manager_.lock_details();
  ASSERT_EQ(details.size(), 1U);
  EXPECT_EQ(details.front().record.type, LockType::Exclusive);
  EXPECT_EQ(details.front().record.hold_count, 1);
}

TEST_F(AdvisoryLockManagerTest, ReleasingAnUnheldLockIsNotAnError) {
  server_.unlock_result = false;
  auto released = test::run_coro(manager_.release_lock(*conn_, "nothing"));
  ASSERT_TRUE(released.has_value());
  EXPECT_FALSE(released->released);
  EXPECT_EQ(released->lock_key, manager_.generate_lock_key("nothing"));
}

TEST_F(AdvisoryLockManagerTest, ReleaseAllDropsSessionRecords) {
  ASSERT_TRUE(test::run_coro(manager_.acquire_exclusive_lock(*conn_, "a")));
  ASSERT_TRUE(test::run_coro(manager_.acquire_shared_lock(*conn_, "b")));

  auto stats = manager_.lock_statistics();
  EXPECT_EQ(stats.total_locks, 2U);
  EXPECT_EQ(stats.total_sessions, 1U);
  EXPECT_EQ(stats.active_sessions, (std::vector<std::string>{"4242"}));

  auto released = test::run_coro(manager_.release_all_locks(*conn_));
  ASSERT_TRUE(released.has_value());
  EXPECT_EQ(*released, 2U);
  EXPECT_EQ(conn_->calls_with("pg_advisory_unlock_all()").size(), 1U);
  EXPECT_EQ(manager_.lock_statistics().total_locks, 0U);
}

TEST_F(AdvisoryLockManagerTest, IsLockHeldSplitsBigintKey) {
  auto held = test::run_coro(manager_.is_lock_held(*conn_, "migration"));
  ASSERT_TRUE(held.has_value());
  EXPECT_TRUE(*held);

  auto calls = conn_->calls_with("EXISTS");
  ASSERT_EQ(calls.size(), 1U);
  const auto key = manager_.generate_lock_key("migration");
  EXPECT_EQ(std::get<std::int64_t>(calls[0].params.at(0)), key >> 32);
  EXPECT_EQ(std::get<std::int64_t>(calls[0].params.at(1)), key & 0xffffffff);
  EXPECT_EQ(std::get<std::int64_t>(calls[0].params.at(2)), 1);
}

TEST_F(AdvisoryLockManagerTest, SessionLocksAreReadFromPgLocks) {
  auto locks = test::run_coro(manager_.get_session_locks(*conn_));
  ASSERT_TRUE(locks.has_value());
  ASSERT_EQ(locks->size(), 2U);
  EXPECT_EQ((*locks)[0].lock_key, 1234);
  EXPECT_FALSE((*locks)[0].two_part);
  EXPECT_EQ((*locks)[0].mode, "ExclusiveLock");
  EXPECT_TRUE((*locks)[0].granted);
  EXPECT_TRUE((*locks)[1].two_part);
  EXPECT_TRUE((*locks)[1].fastpath);
  EXPECT_EQ((*locks)[1].session_id, "4242");
}

TEST_F(AdvisoryLockManagerTest, ClearDropsTracking) {
  ASSERT_TRUE(test::run_coro(manager_.acquire_exclusive_lock(*conn_, "a")));
  manager_.clear();
  EXPECT_EQ(manager_.lock_statistics().total_locks, 0U);
  EXPECT_TRUE(manager_.lock_details().empty());
}

TEST_F(AdvisoryLockManagerTest, UnknownSessionWhenPidQueryFails) {
  conn_->set_handler([](std::string_view sql, std::span<const db::Param>)
                         -> Result<db::QueryResult> {
    if (sql.find("pg_backend_pid") != std::string_view::npos) {
      return fail(make_error_code(db::DbErrc::QueryFailed));
    }
    return test::single_value("t");
  });
  auto grant =
      test::run_coro(manager_.try_acquire_exclusive_lock(*conn_, "x"));
  ASSERT_TRUE(grant.has_value());
  EXPECT_EQ(grant->session_id, "unknown");
}
