#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class BackupManager;
class ConnectivityChecker;
class DeferredInstaller;
class EnvironmentDetector;
class ErrorReporter;
class PrivilegedExecutor;
class StateStore;
class StepPlanner;
class SystemProbe;

struct PlannedCommands {
    std::vector<CommandDescriptor> live;
    std::vector<CommandDescriptor> prepare;
    std::vector<CommandDescriptor> boot;
};

struct OrchestratorServices {
    SystemProbe &probe;
    PrivilegedExecutor &executor;
    ConnectivityChecker &connectivity;
    EnvironmentDetector &detector;
    StepPlanner &planner;
    BackupManager &backups;
    DeferredInstaller &deferred;
    StateStore &store;
    ErrorReporter &reporter;
};

/**
 * Drives one installation at a time through
 * Idle -> PreflightChecking -> BackingUp -> Executing -> Verifying ->
 * {Succeeded, Failed}, or Executing -> DeferredPending for strategies that
 * must run at boot. The state value belongs to this instance.
 *
 * Preflight, step and verification failures end in Failed with a report;
 * they are not rethrown, and neither is any other exception raised while the
 * run is in progress. ConcurrentInstallError and DeferredJobPendingError are
 * thrown without touching the state.
 */
class InstallOrchestrator {
public:
    using StateObserver = std::function<void(OrchestratorState)>;

    InstallOrchestrator(OrchestratorServices services, const EngineConfig &config);

    OrchestratorState state() const;

    // Called after every transition, outside the internal lock.
    void setStateObserver(StateObserver observer);

    InstallReport beginInstall(const Strategy &strategy, const EnvironmentSnapshot &snapshot);

    // Honoured only while PreflightChecking or BackingUp.
    bool requestCancel();

    RestoreResult restoreFromBackup(std::int64_t backupId, const EnvironmentSnapshot &snapshot);

    // Observes the deferred job on disk: a pending job puts an idle
    // orchestrator into DeferredPending, a completion marker moves it to
    // DeferredCompleted and closes the history entry.
    JobStatus refreshDeferredStatus();

    // Cancels the pending deferred job and returns to Idle.
    bool abandonDeferredInstall();

    // Rendered commands per phase, including leftover removal when needed.
    PlannedCommands planCommands(const Strategy &strategy, const EnvironmentSnapshot &snapshot);

    static bool isInProgress(OrchestratorState state);

    // Conditions worth telling the user before the run starts, such as
    // Secure Boot blocking unsigned proprietary modules.
    static std::vector<std::string> warningsFor(const Strategy &strategy,
                                                const EnvironmentSnapshot &snapshot);

private:
    void transition(OrchestratorState next);
    void announce(OrchestratorState previous, OrchestratorState next);
    void runInstall(const Strategy &strategy,
                    const EnvironmentSnapshot &snapshot,
                    InstallReport &report,
                    InstallationHistoryEntry &history);
    CommandResult execute(const CommandDescriptor &command);
    bool runCommands(const std::vector<CommandDescriptor> &commands, InstallReport &report);
    bool driverMatches(const Strategy &strategy,
                       const EnvironmentSnapshot &snapshot,
                       const DriverDescriptor &driver);
    void fail(InstallReport &report,
              const std::string &reason,
              const Strategy &strategy,
              const EnvironmentSnapshot &snapshot,
              InstallationHistoryEntry *history);
    void preflight(const Strategy &strategy, const EnvironmentSnapshot &snapshot);
    bool takeCancel();

    OrchestratorServices m_services;
    EngineConfig m_config;

    mutable std::mutex m_mutex;
    OrchestratorState m_state = OrchestratorState::Idle;
    bool m_restoring = false;
    std::atomic<bool> m_cancelRequested{false};
    StateObserver m_observer;
};

} // namespace nvdm
