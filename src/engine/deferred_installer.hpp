#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class PrivilegedExecutor;
class StateStore;
class SystemProbe;

struct StageRequest {
    std::string scriptPath;
    // Files the script needs at boot (the vendor installer); copied next to it.
    std::vector<std::string> payloads;
    StrategyKind strategy = StrategyKind::RunProduction;
    DistroFamily distroFamily = DistroFamily::Unknown;
    std::int64_t historyId = 0;
};

/**
 * Stages a boot-time install: the script is copied to a fixed system
 * location, a oneshot systemd unit runs it once before the display manager
 * starts, and the script leaves a completion marker plus its own log at
 * fixed system paths. At most one job is pending at a time; staging while
 * one is pending throws DeferredJobPendingError. A failed stage removes
 * whatever it had already installed before rethrowing.
 */
class DeferredInstaller {
public:
    DeferredInstaller(StateStore &store,
                      SystemProbe &probe,
                      PrivilegedExecutor &executor,
                      const EngineConfig &config);

    // Bash script that runs the boot-phase commands with abort-on-first-failure.
    std::string buildInstallScript(const Strategy &strategy,
                                   const std::vector<CommandDescriptor> &bootCommands) const;

    // Writes the script under install-on-reboot/ and returns its path.
    std::string writeStagedScript(const Strategy &strategy, const std::string &content) const;

    DeferredInstallJob stage(const StageRequest &request);

    // Read-only. Reflects the on-disk marker, never in-memory state.
    JobStatus checkCompletion() const;

    // Disables and removes a pending job: the unit, the script and any staged
    // NVIDIA-*.run payloads. Other files in the script directory are left alone.
    // Returns false when none is pending.
    bool cancel();

    std::string renderUnit() const;
    std::string systemScriptPath() const;

    static std::map<std::string, std::string> parseMarker(const std::string &text);

private:
    void runOrThrow(const CommandDescriptor &command);
    CommandDescriptor command(const std::string &stepId, std::vector<std::string> argv) const;
    std::vector<CommandDescriptor> teardownCommands(const std::string &prefix,
                                                    const std::string &unitPath) const;
    // Best effort; failures are logged, never thrown.
    void rollbackStaging(const std::string &reason);

    StateStore &m_store;
    SystemProbe &m_probe;
    PrivilegedExecutor &m_executor;
    EngineConfig m_config;
};

} // namespace nvdm
