#include "engine/backup_manager.hpp"

#include <algorithm>
#include <map>
#include <memory>

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"
#include "engine/environment_detector.hpp"
#include "engine/privileged_executor.hpp"
#include "engine/state_store.hpp"
#include "engine/step_planner.hpp"
#include "engine/system_probe.hpp"

namespace nvdm {

namespace {

constexpr std::size_t kMaxCapturedBytes = 64 * 1024;

QString backupDir(std::int64_t id)
{
    return backupsDirPath() + QStringLiteral("/") + QString::number(id);
}

std::string sha256Hex(const std::string &content)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArray::fromStdString(content), QCryptographicHash::Sha256);
    return digest.toHex().toStdString();
}

bool writeCapturedFile(const QString &path, const std::string &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const qint64 written = file.write(content.data(), static_cast<qint64>(content.size()));
    return written == static_cast<qint64>(content.size());
}

void removeBackupDir(std::int64_t id)
{
    QDir dir(backupDir(id));
    if (dir.exists()) {
        dir.removeRecursively();
    }
}

// Nouveau and "no driver" are the same state until the next boot loads
// nouveau; proprietary families have to match exactly.
bool driverRestored(const DriverDescriptor &expected, const DriverDescriptor &detected)
{
    if (expected.isProprietary()) {
        return detected.family == expected.family;
    }
    return !detected.isProprietary();
}

} // namespace

BackupManager::BackupManager(StateStore &store,
                             SystemProbe &probe,
                             PrivilegedExecutor &executor,
                             EnvironmentDetector &detector,
                             StepPlanner &planner,
                             const EngineConfig &config)
    : m_store(store)
    , m_probe(probe)
    , m_executor(executor)
    , m_detector(detector)
    , m_planner(planner)
    , m_config(config)
{
}

const std::vector<std::string> &BackupManager::trackedConfigFiles()
{
    static const std::vector<std::string> files = {
        "/etc/modprobe.d/blacklist-nouveau.conf",
        "/etc/modprobe.d/nouveau.conf",
        "/etc/modprobe.d/nvidia-drm.conf",
        "/etc/X11/xorg.conf",
        "/etc/initramfs-tools/modules",
        "/etc/dracut.conf.d/nouveau.conf",
        "/etc/sddm.conf",
    };
    return files;
}

Backup BackupManager::snapshot(const std::string &label, const EnvironmentSnapshot &environment)
{
    Backup backup;
    backup.createdAt = std::chrono::system_clock::now();
    backup.label = label;
    backup.driver = m_detector.detectDriver(environment.distroFamily);
    backup.packages = queryDriverPackages(m_probe, environment.distroFamily);

    std::map<std::string, std::string> captured;
    int index = 0;
    for (const auto &path : trackedConfigFiles()) {
        ConfigFileRecord record;
        record.path = path;
        record.existed = m_probe.fileExists(path);
        if (record.existed) {
            const auto content = m_probe.readFile(path);
            if (content.has_value()) {
                record.sha256 = sha256Hex(*content);
                if (content->size() <= kMaxCapturedBytes) {
                    record.contentCaptured = true;
                    record.storedAs = "file-" + std::to_string(index);
                    captured[record.storedAs] = *content;
                }
            }
        }
        backup.configFiles.push_back(record);
        ++index;
    }

    // Captured content is written before the record exists, so a failed
    // write never evicts a retained backup.
    std::unique_ptr<QTemporaryDir> staging;
    if (!captured.empty()) {
        if (!QDir().mkpath(backupsDirPath())) {
            throw StoreError("cannot create backup directory " + backupsDirPath().toStdString());
        }
        staging = std::make_unique<QTemporaryDir>(backupsDirPath() + QStringLiteral("/.staging-XXXXXX"));
        if (!staging->isValid()) {
            throw StoreError("cannot create backup staging directory: "
                             + staging->errorString().toStdString());
        }
        for (const auto &[name, content] : captured) {
            if (!writeCapturedFile(staging->filePath(QString::fromStdString(name)), content)) {
                throw StoreError("cannot write backup content " + name);
            }
        }
    }

    const BackupInsertResult inserted = m_store.insertBackup(backup, m_config.maxBackups);
    for (std::int64_t evicted : inserted.evictedIds) {
        removeBackupDir(evicted);
    }

    const std::int64_t id = inserted.backup.id;
    if (staging) {
        removeBackupDir(id);
        if (!QDir().rename(staging->path(), backupDir(id))) {
            m_store.deleteBackup(id);
            throw StoreError("cannot move backup content into place for backup #"
                             + std::to_string(id));
        }
    }

    NVDM_LOG_INFO(QStringLiteral("BackupManager"),
                  QStringLiteral("snapshot"),
                  QStringLiteral("backup_created"),
                  QString::fromStdString(label),
                  QStringLiteral("sqlite_insert_evict"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"backupId", id},
                                  {"driver", inserted.backup.driver},
                                  {"packages", inserted.backup.packages.size()},
                                  {"evicted", inserted.evictedIds}}));
    return inserted.backup;
}

std::vector<Backup> BackupManager::list() const
{
    return m_store.listBackups();
}

bool BackupManager::remove(std::int64_t id)
{
    const bool removed = m_store.deleteBackup(id);
    if (removed) {
        removeBackupDir(id);
        NVDM_LOG_INFO(QStringLiteral("BackupManager"),
                      QStringLiteral("remove"),
                      QStringLiteral("backup_deleted"),
                      QStringLiteral("user_request"),
                      QStringLiteral("sqlite_delete"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      (nlohmann::json{{"backupId", id}}));
    }
    return removed;
}

RestoreResult BackupManager::restore(std::int64_t id, const EnvironmentSnapshot &environment)
{
    RestoreResult result;
    result.backupId = id;

    const auto target = m_store.getBackup(id);
    if (!target.has_value()) {
        result.message = "backup #" + std::to_string(id) + " does not exist";
        return result;
    }

    // Read the captured files first: the pre-restore snapshot may evict
    // the target when it is the oldest retained backup.
    std::vector<StepDescriptor> steps;
    int fileIndex = 0;
    for (const auto &record : target->configFiles) {
        StepDescriptor step;
        step.id = "restore-config-" + std::to_string(fileIndex++);
        step.timeout = TimeoutClass::Short;
        if (!record.existed) {
            step.action = StepAction::DeleteFiles;
            step.operands = {record.path};
        } else if (record.contentCaptured) {
            QFile file(backupDir(id) + QStringLiteral("/") + QString::fromStdString(record.storedAs));
            if (!file.open(QIODevice::ReadOnly)) {
                result.message = "captured content of " + record.path + " is missing";
                return result;
            }
            step.action = StepAction::WriteConfigFile;
            step.operands = {record.path, file.readAll().toStdString()};
        } else {
            continue;
        }
        steps.push_back(step);
    }

    StepDescriptor packages;
    packages.id = "restore-packages";
    packages.action = StepAction::ReinstallPackages;
    packages.operands = target->packages;
    packages.timeout = TimeoutClass::PackageTransaction;
    steps.insert(steps.begin(), packages);

    // Driver packages installed since the backup go before the reinstall.
    StepDescriptor removal;
    removal.id = "restore-remove-packages";
    removal.action = StepAction::RemovePackages;
    removal.timeout = TimeoutClass::PackageTransaction;
    for (const auto &name : queryDriverPackages(m_probe, environment.distroFamily)) {
        if (std::find(target->packages.begin(), target->packages.end(), name)
            == target->packages.end()) {
            removal.operands.push_back(name);
        }
    }
    if (!removal.operands.empty()) {
        steps.insert(steps.begin(), removal);
    }

    StepDescriptor initramfs;
    initramfs.id = "restore-initramfs";
    initramfs.action = StepAction::RebuildInitramfs;
    initramfs.timeout = TimeoutClass::PackageTransaction;
    steps.push_back(initramfs);

    const Backup preRestore = snapshot("before restore of backup #" + std::to_string(id), environment);
    result.preRestoreBackupId = preRestore.id;

    Strategy context;
    context.distroFamily = environment.distroFamily;
    for (const auto &command : m_planner.render(steps, context, environment)) {
        const CommandResult outcome = m_executor.runElevated(command);
        if (!outcome.succeeded() && !StepPlanner::acceptsFailure(command, outcome)) {
            result.failedStepId = command.stepId;
            result.failedStepOutput = outcome;
            result.message = "restore step " + command.stepId + " failed";
            NVDM_LOG_ERROR(QStringLiteral("BackupManager"),
                           QStringLiteral("restore"),
                           QStringLiteral("restore_failed"),
                           QStringLiteral("step_failed"),
                           QStringLiteral("privileged_executor"),
                           logging::defaultWho(),
                           logging::currentCorrelationId(),
                           (nlohmann::json{{"backupId", id},
                                           {"step", command.stepId},
                                           {"result", outcome}}));
            return result;
        }
    }

    result.restoredDriver = m_detector.detectDriver(environment.distroFamily);
    if (!driverRestored(target->driver, result.restoredDriver)) {
        result.message = "backup #" + std::to_string(id) + " held the "
            + toDriverFamilyString(target->driver.family) + " driver but "
            + toDriverFamilyString(result.restoredDriver.family) + " was detected after restoring";
        NVDM_LOG_ERROR(QStringLiteral("BackupManager"),
                       QStringLiteral("restore"),
                       QStringLiteral("restore_driver_mismatch"),
                       QString::fromStdString(result.message),
                       QStringLiteral("driver_detection"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"backupId", id},
                                       {"expected", target->driver},
                                       {"detected", result.restoredDriver}}));
        return result;
    }

    result.ok = true;
    result.message = "restored backup #" + std::to_string(id);
    NVDM_LOG_INFO(QStringLiteral("BackupManager"),
                  QStringLiteral("restore"),
                  QStringLiteral("restore_completed"),
                  QStringLiteral("user_request"),
                  QStringLiteral("privileged_executor"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"backupId", id},
                                  {"preRestoreBackupId", preRestore.id},
                                  {"driver", result.restoredDriver}}));
    return result;
}

} // namespace nvdm
