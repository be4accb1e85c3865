#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace nvdm {

struct BackupInsertResult {
    Backup backup;
    std::vector<std::int64_t> evictedIds;
};

/**
 * SQLite access layer for cross-invocation state: the backup index, the
 * installation history, the deferred job slot and a key/value meta table.
 * Every mutation that must stay atomic runs in one transaction.
 */
class StateStore {
public:
    StateStore();
    explicit StateStore(const std::string &databasePath);
    ~StateStore();

    StateStore(const StateStore &) = delete;
    StateStore &operator=(const StateStore &) = delete;

    // Inserts and evicts the oldest records (by creation time) beyond
    // maxBackups inside one transaction. Throws BackupRetentionError if
    // the cap still does not hold; nothing is committed then.
    BackupInsertResult insertBackup(const Backup &backup, int maxBackups);
    std::vector<Backup> listBackups() const;
    std::optional<Backup> getBackup(std::int64_t id) const;
    bool deleteBackup(std::int64_t id);
    int countBackups() const;

    std::int64_t addHistory(const InstallationHistoryEntry &entry);
    void updateHistory(const InstallationHistoryEntry &entry);
    std::vector<InstallationHistoryEntry> listHistory() const;
    std::optional<InstallationHistoryEntry> lastHistory() const;
    std::optional<InstallationHistoryEntry> getHistory(std::int64_t id) const;

    // Throws DeferredJobPendingError while another job is still pending.
    DeferredInstallJob insertDeferredJob(const DeferredInstallJob &job);
    std::optional<DeferredInstallJob> pendingDeferredJob() const;
    std::optional<DeferredInstallJob> latestDeferredJob() const;
    void markDeferredJobCompleted(std::int64_t id);
    void deleteDeferredJob(std::int64_t id);

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace nvdm
