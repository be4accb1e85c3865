#include "common/paths.hpp"

#include <QDir>
#include <QFileInfo>

namespace nvdm {

QString appRootPath()
{
    const QString base = qEnvironmentVariable("NVDM_BASE").trimmed();
    if (!base.isEmpty() && QFileInfo(base).isDir()) {
        return QFileInfo(base).absoluteFilePath();
    }

    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/nvdm");
    }
    return home + QStringLiteral("/.local/share/nvdm");
}

QString logsDirPath()
{
    return appRootPath() + QStringLiteral("/logs");
}

QString errorReportsDirPath()
{
    return logsDirPath() + QStringLiteral("/errors");
}

QString cacheDirPath()
{
    return appRootPath() + QStringLiteral("/cache");
}

QString backupsDirPath()
{
    return cacheDirPath() + QStringLiteral("/backups");
}

QString downloadsDirPath()
{
    return cacheDirPath() + QStringLiteral("/downloads");
}

QString stagedScriptsDirPath()
{
    return appRootPath() + QStringLiteral("/install-on-reboot");
}

QString stateDatabasePath()
{
    return cacheDirPath() + QStringLiteral("/state.db");
}

QString configFilePath()
{
    return appRootPath() + QStringLiteral("/config.json");
}

bool ensureAppLayout()
{
    const QString dirs[] = {
        logsDirPath(),
        errorReportsDirPath(),
        cacheDirPath(),
        backupsDirPath(),
        downloadsDirPath(),
        stagedScriptsDirPath(),
    };

    bool ok = true;
    for (const QString &dir : dirs) {
        if (!QDir().mkpath(dir)) {
            ok = false;
        }
    }
    return ok;
}

} // namespace nvdm
