#include "common/config.hpp"

#include <algorithm>
#include <set>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/paths.hpp"

namespace nvdm {

namespace {

constexpr int kRequiredMaxBackups = 10;
constexpr long long kMaxStepSeconds = 24 * 60 * 60;
constexpr long long kMaxConnectivityMs = 60 * 1000;

const std::set<std::string> kKnownKeys = {
    "connectivityHost", "connectivityPort", "connectivityTimeoutMs",
    "stepTimeoutSeconds", "packageInstallTimeoutSeconds", "minFreeDiskMb",
    "maxBackups", "driverVersions", "systemScriptDir", "deferredLogPath",
    "deferredMarkerPath", "deferredUnitPath",
};
const std::set<std::string> kKnownVersionKeys = {"production", "newFeature", "beta", "legacy"};

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        NVDM_LOG_WARN(QStringLiteral("Config"),
                      QStringLiteral("readJsonFile"),
                      QStringLiteral("config_parse_failed"),
                      QStringLiteral("malformed_json"),
                      QStringLiteral("defaults_used"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}}));
        return nlohmann::json();
    }
}

void warnInvalid(const std::string &key)
{
    NVDM_LOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("loadEngineConfig"),
                  QStringLiteral("config_value_ignored"),
                  QStringLiteral("invalid_type_or_range"),
                  QStringLiteral("default_kept"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"key", key}}));
}

template <typename T>
void readValue(const nlohmann::json &root, const std::string &key, T &target)
{
    if (!root.contains(key)) {
        return;
    }
    try {
        target = root.at(key).get<T>();
    } catch (const nlohmann::json::exception &) {
        warnInvalid(key);
    }
}

void warnClamped(const std::string &key, long long value, long long limit)
{
    NVDM_LOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("loadEngineConfig"),
                  QStringLiteral("config_value_clamped"),
                  QStringLiteral("above_maximum"),
                  QStringLiteral("maximum_used"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"key", key}, {"value", value}, {"maximum", limit}}));
}

void warnUnknownKeys(const nlohmann::json &object, const std::set<std::string> &known,
                     const std::string &prefix)
{
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (known.count(it.key()) == 0) {
            NVDM_LOG_WARN(QStringLiteral("Config"),
                          QStringLiteral("loadEngineConfig"),
                          QStringLiteral("config_key_unknown"),
                          QStringLiteral("not_recognized"),
                          QStringLiteral("ignored"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"key", prefix + it.key()}}));
        }
    }
}

// Positive and at most `limit`; larger values are clamped.
long long readBoundedCount(const nlohmann::json &root, const std::string &key,
                           long long current, long long limit)
{
    long long value = current;
    readValue(root, key, value);
    if (value <= 0) {
        warnInvalid(key);
        return current;
    }
    if (value > limit) {
        warnClamped(key, value, limit);
        return limit;
    }
    return value;
}

void readPositiveSeconds(const nlohmann::json &root, const std::string &key,
                         std::chrono::seconds &target)
{
    target = std::chrono::seconds(readBoundedCount(root, key, target.count(), kMaxStepSeconds));
}

bool isSafeAbsolutePath(const std::string &path)
{
    if (path.size() < 2 || path.front() != '/') {
        return false;
    }
    std::size_t start = 1;
    while (start <= path.size()) {
        const std::size_t end = std::min(path.find('/', start), path.size());
        const std::string component = path.substr(start, end - start);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::string lastComponent(const std::string &path)
{
    return path.substr(path.rfind('/') + 1);
}

void readSystemPath(const nlohmann::json &root, const std::string &key, std::string &target,
                    bool (*accepts)(const std::string &))
{
    std::string value = target;
    readValue(root, key, value);
    if (value == target) {
        return;
    }
    if (isSafeAbsolutePath(value) && accepts(value)) {
        target = value;
    } else {
        warnInvalid(key);
    }
}

bool anyPath(const std::string &)
{
    return true;
}

// Cancel deletes this directory once empty.
bool ownedScriptDir(const std::string &path)
{
    return lastComponent(path).find("nvdm") != std::string::npos;
}

bool serviceUnit(const std::string &path)
{
    const std::string name = lastComponent(path);
    return name.size() > 8 && name.compare(name.size() - 8, 8, ".service") == 0;
}

} // namespace

EngineConfig loadEngineConfig()
{
    return loadEngineConfig(configFilePath());
}

EngineConfig loadEngineConfig(const QString &path)
{
    EngineConfig config;

    const nlohmann::json root = readJsonFile(path);
    if (root.is_object()) {
        warnUnknownKeys(root, kKnownKeys, std::string());
        readValue(root, "connectivityHost", config.connectivityHost);
        readValue(root, "connectivityPort", config.connectivityPort);
        if (config.connectivityPort <= 0 || config.connectivityPort > 65535) {
            warnInvalid("connectivityPort");
            config.connectivityPort = 443;
        }

        config.connectivityTimeout = std::chrono::milliseconds(readBoundedCount(
            root, "connectivityTimeoutMs", config.connectivityTimeout.count(), kMaxConnectivityMs));

        readPositiveSeconds(root, "stepTimeoutSeconds", config.stepTimeout);
        readPositiveSeconds(root, "packageInstallTimeoutSeconds",
                            config.packageTransactionTimeout);
        readValue(root, "minFreeDiskMb", config.minFreeDiskMb);

        int maxBackups = kRequiredMaxBackups;
        readValue(root, "maxBackups", maxBackups);
        if (maxBackups != kRequiredMaxBackups) {
            warnInvalid("maxBackups");
        }

        if (root.contains("driverVersions") && root.at("driverVersions").is_object()) {
            const auto &versions = root.at("driverVersions");
            warnUnknownKeys(versions, kKnownVersionKeys, "driverVersions.");
            readValue(versions, "production", config.driverVersions.production);
            readValue(versions, "newFeature", config.driverVersions.newFeature);
            readValue(versions, "beta", config.driverVersions.beta);
            readValue(versions, "legacy", config.driverVersions.legacy);
        }

        readSystemPath(root, "systemScriptDir", config.system.scriptDir, ownedScriptDir);
        readSystemPath(root, "deferredLogPath", config.system.logPath, anyPath);
        readSystemPath(root, "deferredMarkerPath", config.system.markerPath, anyPath);
        readSystemPath(root, "deferredUnitPath", config.system.unitPath, serviceUnit);
        config.system.unitName = lastComponent(config.system.unitPath);
    }

    const QString hostOverride = qEnvironmentVariable("NVDM_CONNECTIVITY_HOST");
    if (!hostOverride.isEmpty()) {
        config.connectivityHost = hostOverride.toStdString();
    }

    return config;
}

} // namespace nvdm
