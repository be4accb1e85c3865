#pragma once

#include <QString>

namespace nvdm {

// Fixed per-user layout. The root is $NVDM_BASE when it names a directory,
// otherwise $HOME/.local/share/nvdm.
QString appRootPath();
QString logsDirPath();
QString errorReportsDirPath();
QString cacheDirPath();
QString backupsDirPath();
QString downloadsDirPath();
QString stagedScriptsDirPath();
QString stateDatabasePath();
QString configFilePath();

// Creates every directory of the layout. Returns false if any mkpath fails.
bool ensureAppLayout();

} // namespace nvdm
