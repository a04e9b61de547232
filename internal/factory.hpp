#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/migration/legacy_migration.hpp"
#include "internal/recovery/session_recovery.hpp"
#include "internal/state/state_manager.hpp"

namespace fetchledger::factory {

/*
  Application

  Owns the long-lived components used by one process.
  recovery refers to state, so state is declared (and destroyed) first.
*/
struct Application {
  std::unique_ptr<state::StateManager>       state;
  std::unique_ptr<recovery::SessionRecovery> recovery;
  migration::MigrationOptions                migration;
};

// Zero / unset config values fall back to the component defaults.
state::StateManager::Options       BuildStateOptions(const fetchledger::runtime::config::RuntimeConfig& config);
recovery::SessionRecovery::Options BuildRecoveryOptions(const fetchledger::runtime::config::RuntimeConfig& config);
migration::MigrationOptions        BuildMigrationOptions(const fetchledger::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that turns RuntimeConfig into concrete
  components.
*/
Application Build(const fetchledger::runtime::config::RuntimeConfig& config);

} // namespace fetchledger::factory
