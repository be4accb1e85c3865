#pragma once

#include <string>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class ConnectivityChecker;
class PrivilegedExecutor;
class SystemProbe;

struct OsRelease {
    std::string id;
    std::string name;
};

/**
 * Gathers the facts one orchestration run is planned against. detect()
 * throws DetectionError when the distribution family is unknown or no
 * NVIDIA device is present.
 */
class EnvironmentDetector {
public:
    EnvironmentDetector(SystemProbe &probe,
                        ConnectivityChecker &connectivity,
                        const EngineConfig &config);

    EnvironmentSnapshot detect();

    // Active driver only; used again after installation to verify.
    DriverDescriptor detectDriver(DistroFamily family);

    // inxi summary. Requests installation of inxi once when it is missing
    // and an executor is available; returns an empty string otherwise.
    std::string systemInfo(DistroFamily family, PrivilegedExecutor *executor);

    static OsRelease parseOsRelease(const std::string &text);
    static DistroFamily familyForId(const std::string &id);
    static KernelVersion parseKernelVersion(const std::string &release);
    // First NVIDIA display controller line, or empty.
    static std::string parseGpu(const std::string &lspciOutput);

private:
    std::string packageManagerFor(DistroFamily family);
    std::optional<DriverDescriptor> repoDriverPackage(DistroFamily family);

    SystemProbe &m_probe;
    ConnectivityChecker &m_connectivity;
    EngineConfig m_config;
    bool m_inxiInstallRequested = false;
};

} // namespace nvdm
