#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class EnvironmentDetector;
class PrivilegedExecutor;
class StateStore;
class StepPlanner;
class SystemProbe;

/**
 * Captures the driver state (driver descriptor, driver packages, the
 * modprobe/X11/initramfs config files it depends on) before anything is
 * mutated, and restores it on request. Retention is capped by the store.
 */
class BackupManager {
public:
    BackupManager(StateStore &store,
                  SystemProbe &probe,
                  PrivilegedExecutor &executor,
                  EnvironmentDetector &detector,
                  StepPlanner &planner,
                  const EngineConfig &config);

    Backup snapshot(const std::string &label, const EnvironmentSnapshot &environment);

    // Newest first.
    std::vector<Backup> list() const;

    // Takes a pre-restore backup first, so a restore can itself be undone.
    RestoreResult restore(std::int64_t id, const EnvironmentSnapshot &environment);

    // Explicit user deletion. Returns false for an unknown id.
    bool remove(std::int64_t id);

    // Config files captured by every snapshot.
    static const std::vector<std::string> &trackedConfigFiles();

private:
    StateStore &m_store;
    SystemProbe &m_probe;
    PrivilegedExecutor &m_executor;
    EnvironmentDetector &m_detector;
    StepPlanner &m_planner;
    EngineConfig m_config;
};

} // namespace nvdm
