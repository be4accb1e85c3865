#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <QString>

namespace nvdm {

struct DriverVersions {
    std::string production = "580.126.09";
    std::string newFeature = "590.48.01";
    std::string beta = "575.54.14";
    std::string legacy = "470.256.02";
};

// Fixed locations reachable by the boot-time context, outside the per-user root.
struct SystemLocations {
    std::string scriptDir = "/usr/local/lib/nvdm-deferred";
    std::string logPath = "/var/log/nvdm-deferred-install.log";
    std::string markerPath = "/var/lib/nvdm/deferred-install.state";
    std::string unitPath = "/etc/systemd/system/nvdm-deferred-install.service";
    // Always the basename of unitPath.
    std::string unitName = "nvdm-deferred-install.service";
};

struct EngineConfig {
    std::string connectivityHost = "download.nvidia.com";
    int connectivityPort = 443;
    std::chrono::milliseconds connectivityTimeout{3000};

    std::chrono::seconds shortStepTimeout{60};
    std::chrono::seconds stepTimeout{900};
    std::chrono::seconds packageTransactionTimeout{3600};

    std::uint64_t minFreeDiskMb = 1536;
    int maxBackups = 10;

    DriverVersions driverVersions;
    SystemLocations system;
};

// Reads config.json from the application root and applies environment
// overrides. Missing or malformed values keep their defaults; unknown keys
// are logged and ignored. Timeouts above their maximum (24h for steps, 60s
// for connectivity) are clamped. System paths must be absolute without
// `.` or `..` components; the script directory's name must contain "nvdm"
// and the unit path must name a .service file, whose basename becomes
// unitName.
EngineConfig loadEngineConfig();
EngineConfig loadEngineConfig(const QString &path);

} // namespace nvdm
