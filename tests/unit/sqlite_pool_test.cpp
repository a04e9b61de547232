#include "internal/db/sqlite/sqlite_pool.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace {

using fetchledger::db::sqlite::PoolOptions;
using fetchledger::db::sqlite::SqlitePool;
using fetchledger::db::sqlite::SqliteTransaction;
using fetchledger::db::sqlite::TransactionMode;

std::string FreshDatabase(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fetchledger_sqlite_pool_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return (dir / "state.db").string();
}

std::shared_ptr<SqlitePool> MakePool(const std::string& name, std::size_t max, std::size_t prewarm, std::chrono::milliseconds timeout) {
  PoolOptions options;
  options.path                = FreshDatabase(name);
  options.max_connections     = max;
  options.prewarm_connections = prewarm;
  options.acquire_timeout     = timeout;
  return std::make_shared<SqlitePool>(std::move(options));
}

void TestPrewarmIsCappedAtMax() {
  auto pool = MakePool("prewarm", 2, 5, std::chrono::milliseconds(100));
  assert(pool->LiveConnections() == 2);
  assert(pool->IdleConnections() == 2);
  assert(pool->MaxConnections() == 2);
}

void TestReleasedConnectionIsReused() {
  auto pool = MakePool("reuse", 2, 0, std::chrono::milliseconds(100));
  assert(pool->LiveConnections() == 0);

  const fetchledger::db::sqlite::SqliteDB* first = nullptr;
  {
    auto conn = pool->Acquire();
    first     = conn.get();
    assert(pool->LiveConnections() == 1);
    assert(pool->IdleConnections() == 0);
  }
  assert(pool->IdleConnections() == 1);

  auto again = pool->Acquire();
  assert(again.get() == first);
  assert(pool->LiveConnections() == 1);
}

void TestConnectionsAreConfigured() {
  auto pool = MakePool("pragmas", 1, 1, std::chrono::milliseconds(100));
  auto conn = pool->Acquire();

  auto fk = conn->Prepare("PRAGMA foreign_keys;");
  assert(fk.Step() && fk.Int64(0) == 1);

  auto mode = conn->Prepare("PRAGMA journal_mode;");
  assert(mode.Step() && mode.Text(0) == "wal");
}

void TestExhaustedPoolTimesOut() {
  auto pool = MakePool("exhausted", 1, 0, std::chrono::milliseconds(50));
  auto held = pool->Acquire();

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    (void)pool->Acquire();
  } catch (const fetchledger::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(40));
}

void TestWaiterIsWokenByRelease() {
  auto pool = MakePool("waiter", 1, 0, std::chrono::milliseconds(5000));
  auto held = pool->Acquire();

  std::thread releaser([&held] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    held.reset();
  });

  auto conn = pool->Acquire();
  assert(conn);
  releaser.join();
  assert(pool->LiveConnections() == 1);
}

void TestCloseAllRejectsAcquire() {
  auto pool = MakePool("close", 2, 2, std::chrono::milliseconds(100));
  auto held = pool->Acquire();

  pool->CloseAll();
  assert(pool->IdleConnections() == 0);
  assert(pool->LiveConnections() == 1);

  bool threw = false;
  try {
    (void)pool->Acquire();
  } catch (const fetchledger::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // outstanding connection is closed on return, not re-queued
  held.reset();
  assert(pool->LiveConnections() == 0);
  assert(pool->IdleConnections() == 0);
}

void TestConnectionOutlivesPool() {
  std::shared_ptr<fetchledger::db::sqlite::SqliteDB> conn;
  {
    auto pool = MakePool("outlive", 1, 0, std::chrono::milliseconds(100));
    conn      = pool->Acquire();
  }
  conn->Exec("CREATE TABLE IF NOT EXISTS t (x INTEGER);");
  conn.reset();
}

void TestTransactionRollsBackOnScopeExit() {
  auto pool = MakePool("rollback", 2, 1, std::chrono::milliseconds(100));
  pool->Acquire()->Exec("CREATE TABLE t (x INTEGER);");

  {
    SqliteTransaction tx(pool->Acquire(), TransactionMode::kWrite);
    tx.Prepare("INSERT INTO t(x) VALUES(?);").Bind(1, static_cast<std::int64_t>(1)).Run();
  }

  {
    SqliteTransaction tx(pool->Acquire(), TransactionMode::kWrite);
    tx.Prepare("INSERT INTO t(x) VALUES(?);").Bind(1, static_cast<std::int64_t>(2)).Run();
    tx.Commit();
  }

  auto conn = pool->Acquire();
  auto st   = conn->Prepare("SELECT COUNT(*), MAX(x) FROM t;");
  assert(st.Step());
  assert(st.Int64(0) == 1);
  assert(st.Int64(1) == 2);
}

void TestConstraintErrorsAreTranslated() {
  auto pool = MakePool("constraint", 1, 1, std::chrono::milliseconds(100));
  auto conn = pool->Acquire();
  conn->Exec("CREATE TABLE t (x INTEGER PRIMARY KEY);");
  conn->Exec("INSERT INTO t(x) VALUES(1);");

  bool threw = false;
  try {
    conn->Prepare("INSERT INTO t(x) VALUES(?);").Bind(1, static_cast<std::int64_t>(1)).Run();
  } catch (const fetchledger::util::ConstraintViolation&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPrewarmIsCappedAtMax();
  TestReleasedConnectionIsReused();
  TestConnectionsAreConfigured();
  TestExhaustedPoolTimesOut();
  TestWaiterIsWokenByRelease();
  TestCloseAllRejectsAcquire();
  TestConnectionOutlivesPool();
  TestTransactionRollsBackOnScopeExit();
  TestConstraintErrorsAreTranslated();

  std::cout << "fetchledger_unit_sqlite_pool: pass\n";
  return 0;
}
