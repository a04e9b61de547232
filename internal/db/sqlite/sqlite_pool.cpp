#include "sqlite_pool.hpp"

#include <algorithm>

#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace fetchledger::db::sqlite {

SqlitePool::SqlitePool(PoolOptions options) : options_(std::move(options)) {
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }

  const auto prewarm = std::min(options_.prewarm_connections, options_.max_connections);
  for (std::size_t i = 0; i < prewarm; ++i) {
    idle_.push_back(CreateConnection());
    ++live_connections_;
  }
}

SqlitePool::~SqlitePool() = default;

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  return Acquire(options_.acquire_timeout);
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire(std::chrono::milliseconds timeout) {
  const auto started  = std::chrono::steady_clock::now();
  const auto deadline = started + timeout;

  auto observe_wait = [started] {
    const auto waited = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
    observability::Metrics::Instance().ObservePoolWaitMs(waited.count());
  };

  std::unique_lock lock(mutex_);
  for (;;) {
    if (closed_) {
      throw util::InvalidState("connection pool for " + options_.path + " is closed");
    }

    if (!idle_.empty()) {
      auto conn = std::move(idle_.front());
      idle_.pop_front();
      lock.unlock();
      observe_wait();
      return Wrap(std::move(conn));
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = CreateConnection();
        observe_wait();
        return Wrap(std::move(conn));
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool available = cv_.wait_until(lock, deadline, [this] {
      return closed_ || !idle_.empty() || live_connections_ < options_.max_connections;
    });
    if (!available) {
      throw util::ResourceExhausted("timed out after " + std::to_string(timeout.count()) + "ms waiting for a connection to " +
                                    options_.path + " (max_connections=" + std::to_string(options_.max_connections) + ")");
    }
  }
}

void SqlitePool::CloseAll() {
  std::deque<std::unique_ptr<SqliteDB>> drained;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    drained.swap(idle_);
    live_connections_ -= drained.size();
  }
  cv_.notify_all();
  // connections close here, outside the lock
}

std::size_t SqlitePool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::size_t SqlitePool::IdleConnections() const {
  std::lock_guard lock(mutex_);
  return idle_.size();
}

std::unique_ptr<SqliteDB> SqlitePool::CreateConnection() const {
  return std::make_unique<SqliteDB>(options_.path, options_.connection);
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(std::unique_ptr<SqliteDB> conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn.release(), [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  std::unique_ptr<SqliteDB> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (!closed_ && idle_.size() < options_.max_connections) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
  // a connection that was not queued closes here
}

} // namespace fetchledger::db::sqlite
