#pragma once

#include <string>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nvdm {

class SystemProbe;

struct RepoDriver {
    // Debian branch number ("580"); empty on Fedora.
    std::string branch;
    std::string version;
};

/**
 * Knows which vendor installer versions exist per release tier and which
 * repository driver branch each repository strategy targets. Starts from
 * the configured fallback versions until refresh() succeeds.
 */
class VersionCatalog {
public:
    VersionCatalog(SystemProbe &probe, const EngineConfig &config);

    const DriverVersions &versions() const;

    // Fetches the vendor directory listing for the given architecture
    // ("Linux-x86_64"). Returns false and keeps the current versions when
    // neither curl nor wget produce a listing.
    bool refresh(const std::string &architecture);

    // Installer version for a Run* strategy; empty for other strategies.
    std::string installerVersion(StrategyKind kind) const;

    RepoDriver repoDriver(StrategyKind kind, DistroFamily family);

    static DriverVersions parseListing(const std::string &listing,
                                       const DriverVersions &fallback);
    // Numeric, component-wise comparison of dotted versions.
    static bool versionLess(const std::string &a, const std::string &b);

private:
    SystemProbe &m_probe;
    DriverVersions m_versions;
};

} // namespace nvdm
