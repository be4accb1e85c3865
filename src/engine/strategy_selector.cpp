#include "engine/strategy_selector.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/version_catalog.hpp"

namespace nvdm {

StrategySelector::StrategySelector(VersionCatalog &catalog, const StepTable &table)
    : m_catalog(catalog)
    , m_table(table)
{
}

Strategy StrategySelector::select(StrategyKind kind, const EnvironmentSnapshot &snapshot) const
{
    const StrategyRow *row = m_table.find(kind, snapshot.distroFamily);
    if (row == nullptr) {
        throw UnsupportedDistributionError(
            "strategy " + toStrategyString(kind) + " is not available on "
            + toDistroString(snapshot.distroFamily));
    }

    if (row->minimumKernel.has_value()
        && !snapshot.kernel.atLeast(row->minimumKernel->major, row->minimumKernel->minor)) {
        throw UnsupportedKernelError(
            toStrategyString(kind) + " requires kernel "
            + std::to_string(row->minimumKernel->major) + "."
            + std::to_string(row->minimumKernel->minor) + " or newer, found '"
            + snapshot.kernel.release + "'");
    }

    if (kind == StrategyKind::UpgradeRepo
        && snapshot.currentDriver.family != DriverFamily::ProprietaryRepo) {
        throw SelectionError("no repository driver package is installed to upgrade");
    }
    if (kind == StrategyKind::RemoveProprietary && !snapshot.currentDriver.isProprietary()) {
        throw SelectionError("no proprietary driver is installed");
    }

    Strategy strategy;
    strategy.kind = kind;
    strategy.distroFamily = row->family;
    strategy.steps = row->steps;
    strategy.requiresRebootDeferral = row->requiresRebootDeferral;
    strategy.removesExistingDriver = row->removesExistingDriver;
    strategy.minimumKernel = row->minimumKernel;
    strategy.expectedDriver = row->expectedDriver;

    switch (kind) {
    case StrategyKind::RunProduction:
    case StrategyKind::RunNewFeature:
    case StrategyKind::RunBeta:
    case StrategyKind::RunLegacy:
        strategy.targetVersion = m_catalog.installerVersion(kind);
        break;
    case StrategyKind::RepoStable:
    case StrategyKind::RepoLatest: {
        const RepoDriver repo = m_catalog.repoDriver(kind, snapshot.distroFamily);
        strategy.targetVersion = repo.version;
        strategy.repoBranch = repo.branch;
        break;
    }
    case StrategyKind::UpgradeRepo:
        strategy.targetVersion = snapshot.currentDriver.version;
        break;
    case StrategyKind::NVK:
        strategy.targetVersion = "mesa";
        break;
    case StrategyKind::RemoveProprietary:
        break;
    }

    NVDM_LOG_INFO(QStringLiteral("StrategySelector"),
                  QStringLiteral("select"),
                  QStringLiteral("strategy_selected"),
                  QStringLiteral("user_request"),
                  QStringLiteral("step_table"),
                  QStringLiteral("system"),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"strategy", toStrategyString(kind)},
                                  {"distro", toDistroString(strategy.distroFamily)},
                                  {"targetVersion", strategy.targetVersion},
                                  {"steps", strategy.steps.size()}}));
    return strategy;
}

} // namespace nvdm
