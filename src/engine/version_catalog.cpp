#include "engine/version_catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::chrono::seconds kListingTimeout{10};
constexpr std::chrono::seconds kRepoQueryTimeout{60};
constexpr const char *kFallbackBranch = "580";

const std::array<int, 8> kDebianBranches = {610, 600, 590, 580, 550, 535, 525, 515};

std::vector<int> versionParts(const std::string &version)
{
    std::vector<int> parts;
    std::string current;
    for (char c : version) {
        if (c == '.') {
            parts.push_back(current.empty() ? 0 : std::stoi(current));
            current.clear();
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            if (current.size() < 9) {
                current.push_back(c);
            }
        } else {
            break;
        }
    }
    parts.push_back(current.empty() ? 0 : std::stoi(current));
    return parts;
}

std::string highestMatch(const std::string &listing, const std::regex &pattern)
{
    std::string best;
    for (auto it = std::sregex_iterator(listing.begin(), listing.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const std::string candidate = (*it)[1].str();
        if (best.empty() || VersionCatalog::versionLess(best, candidate)) {
            best = candidate;
        }
    }
    return best;
}

// "Version: 580.95.05-0ubuntu1" -> "580.95.05"
std::string aptCacheVersion(const std::string &output)
{
    for (const auto &line : splitLines(output)) {
        if (!startsWith(line, "Version:")) {
            continue;
        }
        std::string version = trim(line.substr(8));
        const auto colon = version.find(':');
        if (colon != std::string::npos) {
            version = version.substr(colon + 1);
        }
        return version.substr(0, version.find('-'));
    }
    return {};
}

} // namespace

VersionCatalog::VersionCatalog(SystemProbe &probe, const EngineConfig &config)
    : m_probe(probe)
    , m_versions(config.driverVersions)
{
}

const DriverVersions &VersionCatalog::versions() const
{
    return m_versions;
}

bool VersionCatalog::versionLess(const std::string &a, const std::string &b)
{
    return versionParts(a) < versionParts(b);
}

DriverVersions VersionCatalog::parseListing(const std::string &listing,
                                            const DriverVersions &fallback)
{
    static const std::regex production(R"((58[0-9]\.[0-9]+\.[0-9]+)/)");
    static const std::regex newFeature(R"((590\.(?:4[5-9]|[5-9][0-9]|[0-9]{3,})\.[0-9]+)/)");
    static const std::regex beta(R"((590\.(?:[0-3][0-9]|4[0-4])\.[0-9]+)/)");
    static const std::regex legacy(R"((470\.[0-9]+\.[0-9]+)/)");

    DriverVersions versions = fallback;
    if (auto found = highestMatch(listing, production); !found.empty()) {
        versions.production = found;
    }
    if (auto found = highestMatch(listing, newFeature); !found.empty()) {
        versions.newFeature = found;
    }
    if (auto found = highestMatch(listing, beta); !found.empty()) {
        versions.beta = found;
    }
    if (auto found = highestMatch(listing, legacy); !found.empty()) {
        versions.legacy = found;
    }
    return versions;
}

bool VersionCatalog::refresh(const std::string &architecture)
{
    const std::string url = "https://download.nvidia.com/XFree86/" + architecture + "/";
    const std::vector<std::pair<std::string, std::vector<std::string>>> fetchers = {
        {"curl", {"-s", "-L", url}},
        {"wget", {"-q", "-O", "-", url}},
    };

    for (const auto &[tool, args] : fetchers) {
        const CommandResult result = m_probe.run(tool, args, kListingTimeout);
        if (!result.succeeded() || result.stdoutText.empty()) {
            continue;
        }
        m_versions = parseListing(result.stdoutText, m_versions);
        NVDM_LOG_INFO(QStringLiteral("VersionCatalog"),
                      QStringLiteral("refresh"),
                      QStringLiteral("versions_refreshed"),
                      QStringLiteral("vendor_listing"),
                      QString::fromStdString(tool),
                      QStringLiteral("system"),
                      logging::currentCorrelationId(),
                      (nlohmann::json{{"production", m_versions.production},
                                      {"newFeature", m_versions.newFeature},
                                      {"beta", m_versions.beta},
                                      {"legacy", m_versions.legacy}}));
        return true;
    }

    NVDM_LOG_WARN(QStringLiteral("VersionCatalog"),
                  QStringLiteral("refresh"),
                  QStringLiteral("versions_refresh_failed"),
                  QStringLiteral("vendor_listing"),
                  QStringLiteral("curl+wget"),
                  QStringLiteral("system"),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"url", url}}));
    return false;
}

std::string VersionCatalog::installerVersion(StrategyKind kind) const
{
    switch (kind) {
    case StrategyKind::RunProduction:
        return m_versions.production;
    case StrategyKind::RunNewFeature:
        return m_versions.newFeature;
    case StrategyKind::RunBeta:
        return m_versions.beta;
    case StrategyKind::RunLegacy:
        return m_versions.legacy;
    default:
        return {};
    }
}

RepoDriver VersionCatalog::repoDriver(StrategyKind kind, DistroFamily family)
{
    if (family == DistroFamily::Fedora) {
        RepoDriver driver;
        const CommandResult result = m_probe.run(
            "dnf", {"list", "available", "akmod-nvidia", "-q"}, kRepoQueryTimeout);
        if (result.succeeded()) {
            for (const auto &line : splitLines(result.stdoutText)) {
                const auto fields = splitWhitespace(line);
                if (fields.size() >= 2 && startsWith(fields[0], "akmod-nvidia.")) {
                    std::string version = fields[1];
                    const auto colon = version.find(':');
                    if (colon != std::string::npos) {
                        version = version.substr(colon + 1);
                    }
                    driver.version = version.substr(0, version.find('-'));
                    break;
                }
            }
        }
        if (driver.version.empty()) {
            driver.version = kFallbackBranch;
        }
        return driver;
    }

    std::vector<RepoDriver> available;
    for (int branch : kDebianBranches) {
        const std::string package = "nvidia-driver-" + std::to_string(branch) + "-open";
        const CommandResult result = m_probe.run("apt-cache", {"show", package}, kRepoQueryTimeout);
        if (!result.succeeded()) {
            continue;
        }
        RepoDriver driver;
        driver.branch = std::to_string(branch);
        driver.version = aptCacheVersion(result.stdoutText);
        if (driver.version.find('.') == std::string::npos) {
            driver.version = driver.branch;
        }
        available.push_back(driver);
        if (kind == StrategyKind::RepoLatest) {
            break;
        }
        if (available.size() == 2) {
            break;
        }
    }

    if (available.empty()) {
        return RepoDriver{kFallbackBranch, kFallbackBranch};
    }
    if (kind == StrategyKind::RepoLatest || available.size() == 1) {
        return available.front();
    }
    return available[1];
}

} // namespace nvdm
