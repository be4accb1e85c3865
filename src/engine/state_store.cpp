#include "engine/state_store.hpp"

#include <QDir>
#include <QFileInfo>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/paths.hpp"

namespace nvdm {

namespace {

constexpr const char *kCreateBackupsTable =
    "CREATE TABLE IF NOT EXISTS backups ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    created_at INTEGER NOT NULL,"
    "    label TEXT NOT NULL,"
    "    driver TEXT NOT NULL,"
    "    config_files TEXT NOT NULL,"
    "    packages TEXT NOT NULL"
    ");";

constexpr const char *kCreateHistoryTable =
    "CREATE TABLE IF NOT EXISTS history ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    backup_id INTEGER,"
    "    strategy TEXT NOT NULL,"
    "    target_version TEXT,"
    "    started_at INTEGER NOT NULL,"
    "    finished_at INTEGER,"
    "    outcome TEXT NOT NULL,"
    "    error_report TEXT"
    ");";

constexpr const char *kCreateDeferredJobsTable =
    "CREATE TABLE IF NOT EXISTS deferred_jobs ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    staged_script TEXT NOT NULL,"
    "    system_script TEXT NOT NULL,"
    "    unit_path TEXT NOT NULL,"
    "    context TEXT NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    completed INTEGER NOT NULL DEFAULT 0,"
    "    log_path TEXT NOT NULL,"
    "    marker_path TEXT NOT NULL,"
    "    strategy TEXT NOT NULL,"
    "    history_id INTEGER"
    ");";

// At most one row may be pending.
constexpr const char *kCreatePendingJobIndex =
    "CREATE UNIQUE INDEX IF NOT EXISTS deferred_jobs_single_pending "
    "ON deferred_jobs(completed) WHERE completed = 0;";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kBackupColumns =
    "SELECT id, created_at, label, driver, config_files, packages FROM backups ";

constexpr const char *kHistoryColumns =
    "SELECT id, backup_id, strategy, target_version, started_at, finished_at, "
    "outcome, error_report FROM history ";

constexpr const char *kJobColumns =
    "SELECT id, staged_script, system_script, unit_path, context, created_at, "
    "completed, log_path, marker_path, strategy, history_id FROM deferred_jobs ";

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_done) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_done = true;
    }

private:
    sqlite3 *m_db;
    bool m_done = false;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

void stepDone(sqlite3 *db, const Statement &stmt, const char *what)
{
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

Backup readBackup(sqlite3_stmt *stmt)
{
    Backup backup;
    backup.id = sqlite3_column_int64(stmt, 0);
    backup.createdAt = fromEpochMillis(sqlite3_column_int64(stmt, 1));
    backup.label = columnText(stmt, 2);

    const nlohmann::json driver = columnJson(stmt, 3);
    if (driver.is_object()) {
        backup.driver = driver.get<DriverDescriptor>();
    }
    const nlohmann::json files = columnJson(stmt, 4);
    if (files.is_array()) {
        backup.configFiles = files.get<std::vector<ConfigFileRecord>>();
    }
    const nlohmann::json packages = columnJson(stmt, 5);
    if (packages.is_array()) {
        backup.packages = packages.get<std::vector<std::string>>();
    }
    return backup;
}

InstallationHistoryEntry readHistory(sqlite3_stmt *stmt)
{
    InstallationHistoryEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.backupId = sqlite3_column_int64(stmt, 1);
    entry.strategy = parseStrategyString(columnText(stmt, 2)).value_or(StrategyKind::NVK);
    entry.targetVersion = columnText(stmt, 3);
    entry.startedAt = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        entry.finishedAt = fromEpochMillis(sqlite3_column_int64(stmt, 5));
    }
    entry.outcome = parseOutcomeString(columnText(stmt, 6));
    entry.errorReportPath = columnText(stmt, 7);
    return entry;
}

DeferredInstallJob readJob(sqlite3_stmt *stmt)
{
    DeferredInstallJob job;
    job.id = sqlite3_column_int64(stmt, 0);
    job.stagedScriptPath = columnText(stmt, 1);
    job.systemScriptPath = columnText(stmt, 2);
    job.unitPath = columnText(stmt, 3);
    job.executionContext = columnText(stmt, 4);
    job.createdAt = fromEpochMillis(sqlite3_column_int64(stmt, 5));
    job.completed = sqlite3_column_int(stmt, 6) != 0;
    job.logPath = columnText(stmt, 7);
    job.markerPath = columnText(stmt, 8);
    job.strategy = parseStrategyString(columnText(stmt, 9)).value_or(StrategyKind::RunProduction);
    job.historyId = sqlite3_column_int64(stmt, 10);
    return job;
}

} // namespace

struct StateStore::Impl {
    sqlite3 *db = nullptr;
};

StateStore::StateStore()
    : StateStore(stateDatabasePath().toStdString())
{
}

StateStore::StateStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    QDir().mkpath(QFileInfo(QString::fromStdString(databasePath)).absolutePath());

    if (sqlite3_open(databasePath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StoreError("failed to open state database " + databasePath + ": " + message);
    }
    sqlite3_busy_timeout(impl->db, 5000);

    execOrThrow(impl->db, kCreateBackupsTable);
    execOrThrow(impl->db, kCreateHistoryTable);
    execOrThrow(impl->db, kCreateDeferredJobsTable);
    execOrThrow(impl->db, kCreatePendingJobIndex);
    execOrThrow(impl->db, kCreateMetaTable);
}

StateStore::~StateStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

BackupInsertResult StateStore::insertBackup(const Backup &backup, int maxBackups)
{
    BackupInsertResult result;
    result.backup = backup;

    Transaction transaction(impl->db);
    {
        Statement stmt(impl->db,
                       "INSERT INTO backups (created_at, label, driver, config_files, packages) "
                       "VALUES (?, ?, ?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(backup.createdAt));
        bindText(stmt.get(), 2, backup.label);
        bindText(stmt.get(), 3, nlohmann::json(backup.driver).dump());
        bindText(stmt.get(), 4, nlohmann::json(backup.configFiles).dump());
        bindText(stmt.get(), 5, nlohmann::json(backup.packages).dump());
        stepDone(impl->db, stmt, "failed to insert backup");
        result.backup.id = sqlite3_last_insert_rowid(impl->db);
    }

    const auto count = [this]() {
        Statement stmt(impl->db, "SELECT COUNT(*) FROM backups;");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StoreError("failed to count backups");
        }
        return sqlite3_column_int(stmt.get(), 0);
    };

    for (int present = count(); present > maxBackups; --present) {
        Statement oldest(impl->db,
                         "SELECT id FROM backups ORDER BY created_at ASC, id ASC LIMIT 1;");
        if (sqlite3_step(oldest.get()) != SQLITE_ROW) {
            break;
        }
        const std::int64_t evictId = sqlite3_column_int64(oldest.get(), 0);

        Statement remove(impl->db, "DELETE FROM backups WHERE id = ?;");
        sqlite3_bind_int64(remove.get(), 1, evictId);
        stepDone(impl->db, remove, "failed to evict backup");
        result.evictedIds.push_back(evictId);
    }

    if (count() > maxBackups) {
        throw BackupRetentionError("backup cap of " + std::to_string(maxBackups)
                                   + " violated after insert");
    }

    transaction.commit();
    return result;
}

std::vector<Backup> StateStore::listBackups() const
{
    std::vector<Backup> backups;
    Statement stmt(impl->db, std::string(kBackupColumns) + "ORDER BY created_at DESC, id DESC;");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        backups.push_back(readBackup(stmt.get()));
    }
    return backups;
}

std::optional<Backup> StateStore::getBackup(std::int64_t id) const
{
    Statement stmt(impl->db, std::string(kBackupColumns) + "WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return readBackup(stmt.get());
    }
    return std::nullopt;
}

bool StateStore::deleteBackup(std::int64_t id)
{
    Statement stmt(impl->db, "DELETE FROM backups WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stepDone(impl->db, stmt, "failed to delete backup");
    return sqlite3_changes(impl->db) > 0;
}

int StateStore::countBackups() const
{
    Statement stmt(impl->db, "SELECT COUNT(*) FROM backups;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError("failed to count backups");
    }
    return sqlite3_column_int(stmt.get(), 0);
}

std::int64_t StateStore::addHistory(const InstallationHistoryEntry &entry)
{
    Statement stmt(impl->db,
                   "INSERT INTO history (backup_id, strategy, target_version, started_at, "
                   "finished_at, outcome, error_report) VALUES (?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, entry.backupId);
    bindText(stmt.get(), 2, toStrategyString(entry.strategy));
    bindOptionalText(stmt.get(), 3, entry.targetVersion);
    sqlite3_bind_int64(stmt.get(), 4, toEpochMillis(entry.startedAt));
    if (entry.finishedAt.time_since_epoch().count() == 0) {
        sqlite3_bind_null(stmt.get(), 5);
    } else {
        sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(entry.finishedAt));
    }
    bindText(stmt.get(), 6, toOutcomeString(entry.outcome));
    bindOptionalText(stmt.get(), 7, entry.errorReportPath);
    stepDone(impl->db, stmt, "failed to insert history entry");
    return sqlite3_last_insert_rowid(impl->db);
}

void StateStore::updateHistory(const InstallationHistoryEntry &entry)
{
    Statement stmt(impl->db,
                   "UPDATE history SET finished_at = ?, outcome = ?, error_report = ? "
                   "WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(entry.finishedAt));
    bindText(stmt.get(), 2, toOutcomeString(entry.outcome));
    bindOptionalText(stmt.get(), 3, entry.errorReportPath);
    sqlite3_bind_int64(stmt.get(), 4, entry.id);
    stepDone(impl->db, stmt, "failed to update history entry");
}

std::vector<InstallationHistoryEntry> StateStore::listHistory() const
{
    std::vector<InstallationHistoryEntry> entries;
    Statement stmt(impl->db, std::string(kHistoryColumns) + "ORDER BY started_at DESC, id DESC;");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        entries.push_back(readHistory(stmt.get()));
    }
    return entries;
}

std::optional<InstallationHistoryEntry> StateStore::lastHistory() const
{
    Statement stmt(impl->db,
                   std::string(kHistoryColumns) + "ORDER BY started_at DESC, id DESC LIMIT 1;");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return readHistory(stmt.get());
    }
    return std::nullopt;
}

std::optional<InstallationHistoryEntry> StateStore::getHistory(std::int64_t id) const
{
    Statement stmt(impl->db, std::string(kHistoryColumns) + "WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return readHistory(stmt.get());
    }
    return std::nullopt;
}

DeferredInstallJob StateStore::insertDeferredJob(const DeferredInstallJob &job)
{
    Statement stmt(impl->db,
                   "INSERT INTO deferred_jobs (staged_script, system_script, unit_path, context, "
                   "created_at, completed, log_path, marker_path, strategy, history_id) "
                   "VALUES (?, ?, ?, ?, ?, 0, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, job.stagedScriptPath);
    bindText(stmt.get(), 2, job.systemScriptPath);
    bindText(stmt.get(), 3, job.unitPath);
    bindText(stmt.get(), 4, job.executionContext);
    sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(job.createdAt));
    bindText(stmt.get(), 6, job.logPath);
    bindText(stmt.get(), 7, job.markerPath);
    bindText(stmt.get(), 8, toStrategyString(job.strategy));
    sqlite3_bind_int64(stmt.get(), 9, job.historyId);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT) {
        throw DeferredJobPendingError("a deferred install is already pending");
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("failed to insert deferred job: ") + sqlite3_errmsg(impl->db));
    }

    DeferredInstallJob stored = job;
    stored.id = sqlite3_last_insert_rowid(impl->db);
    stored.completed = false;
    return stored;
}

std::optional<DeferredInstallJob> StateStore::pendingDeferredJob() const
{
    Statement stmt(impl->db, std::string(kJobColumns) + "WHERE completed = 0 LIMIT 1;");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return readJob(stmt.get());
    }
    return std::nullopt;
}

std::optional<DeferredInstallJob> StateStore::latestDeferredJob() const
{
    Statement stmt(impl->db,
                   std::string(kJobColumns) + "ORDER BY created_at DESC, id DESC LIMIT 1;");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return readJob(stmt.get());
    }
    return std::nullopt;
}

void StateStore::markDeferredJobCompleted(std::int64_t id)
{
    Statement stmt(impl->db, "UPDATE deferred_jobs SET completed = 1 WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stepDone(impl->db, stmt, "failed to complete deferred job");
}

void StateStore::deleteDeferredJob(std::int64_t id)
{
    Statement stmt(impl->db, "DELETE FROM deferred_jobs WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stepDone(impl->db, stmt, "failed to delete deferred job");
}

std::optional<std::string> StateStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    return std::nullopt;
}

void StateStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stepDone(impl->db, stmt, "failed to write meta");
}

} // namespace nvdm
