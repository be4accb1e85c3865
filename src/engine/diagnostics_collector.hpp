#pragma once

#include <string>

#include "common/models.hpp"

namespace nvdm {

class DeferredInstaller;
class EnvironmentDetector;
class StateStore;
class SystemProbe;

// Read-only health report. Nothing here mutates the system or the store.
class DiagnosticsCollector {
public:
    DiagnosticsCollector(SystemProbe &probe,
                         EnvironmentDetector &detector,
                         StateStore &store,
                         const DeferredInstaller &deferred);

    DiagnosticsReport collect(OrchestratorState orchestratorState);

    // Writes the report as indented JSON. Returns false on I/O failure.
    static bool writeJson(const DiagnosticsReport &report, const std::string &path);

private:
    std::vector<std::string> dkmsStatus();
    std::vector<std::string> kernelModules(const std::string &kernelRelease);
    std::vector<std::string> loadedModules();
    std::vector<std::string> driverSources();

    SystemProbe &m_probe;
    EnvironmentDetector &m_detector;
    StateStore &m_store;
    const DeferredInstaller &m_deferred;
};

} // namespace nvdm
