#include "factory.hpp"

#include <chrono>

#include "internal/util/errors.hpp"

namespace fetchledger::factory {

using fetchledger::runtime::config::RuntimeConfig;

state::StateManager::Options BuildStateOptions(const RuntimeConfig& config) {
  const auto& database = config.database();

  state::StateManager::Options options;
  options.path = database.path();

  if (database.max_connections() > 0) {
    options.max_connections = database.max_connections();
  }
  // 0 is a valid prewarm count, but indistinguishable from unset
  if (database.prewarm_connections() > 0) {
    options.prewarm_connections = database.prewarm_connections();
  }
  if (database.acquire_timeout_ms() > 0) {
    options.acquire_timeout = std::chrono::milliseconds(database.acquire_timeout_ms());
  }
  if (database.busy_timeout_ms() > 0) {
    options.connection.busy_timeout = std::chrono::milliseconds(database.busy_timeout_ms());
  }
  if (database.cache_size_kib() > 0) {
    options.connection.cache_size_kib = static_cast<int>(database.cache_size_kib());
  }
  if (!database.synchronous().empty()) {
    options.connection.synchronous = database.synchronous();
  }

  options.max_download_attempts = config.recovery().max_download_attempts();
  return options;
}

recovery::SessionRecovery::Options BuildRecoveryOptions(const RuntimeConfig& config) {
  const auto& rc = config.recovery();

  recovery::SessionRecovery::Options options;
  if (rc.resumable_max_age_days() > 0) {
    options.resumable_max_age_days = static_cast<int>(rc.resumable_max_age_days());
  }
  if (rc.abandoned_max_age_days() > 0) {
    options.abandoned_max_age_days = static_cast<int>(rc.abandoned_max_age_days());
  }

  switch (rc.checksum_mismatch_policy()) {
    case fetchledger::runtime::config::CHECKSUM_MISMATCH_POLICY_MARK_FAILED:
      options.checksum_policy = recovery::ChecksumMismatchPolicy::kMarkFailed;
      break;
    case fetchledger::runtime::config::CHECKSUM_MISMATCH_POLICY_UNSPECIFIED:
    case fetchledger::runtime::config::CHECKSUM_MISMATCH_POLICY_REPORT:
      options.checksum_policy = recovery::ChecksumMismatchPolicy::kReport;
      break;
    default:
      throw util::InvalidArgument("unsupported recovery.checksum_mismatch_policy");
  }
  return options;
}

migration::MigrationOptions BuildMigrationOptions(const RuntimeConfig& config) {
  const auto& mc = config.migration();

  migration::MigrationOptions options;
  for (const auto& dir : mc.search_dirs()) {
    options.search_dirs.emplace_back(dir);
  }
  options.backup = mc.has_backup() ? mc.backup() : true;
  return options;
}

Application Build(const RuntimeConfig& config) {
  Application app;
  app.state     = std::make_unique<state::StateManager>(BuildStateOptions(config));
  app.recovery  = std::make_unique<recovery::SessionRecovery>(*app.state, BuildRecoveryOptions(config));
  app.migration = BuildMigrationOptions(config);
  return app;
}

} // namespace fetchledger::factory
