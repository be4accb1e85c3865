#pragma once

#include <map>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace nvdm {

// One (strategy, distribution) row. Operands may contain placeholders the
// StepPlanner resolves: {kernel}, {repo_branch}, {repo_package},
// {fedora_release}.
struct StrategyRow {
    StrategyKind kind = StrategyKind::NVK;
    DistroFamily family = DistroFamily::Unknown;
    std::vector<StepDescriptor> steps;
    bool requiresRebootDeferral = false;
    bool removesExistingDriver = false;
    std::optional<KernelVersion> minimumKernel;
    DriverFamily expectedDriver = DriverFamily::None;
};

/**
 * Per-distribution step sequences for every strategy. Supporting another
 * distribution means adding rows here; nothing else branches on the family
 * when choosing steps.
 */
class StepTable {
public:
    static const StepTable &builtin();

    // nullptr when the strategy has no row for that family.
    const StrategyRow *find(StrategyKind kind, DistroFamily family) const;

    // Removal of leftover proprietary configs, packages, modules and
    // libraries, stamped with the requested phase.
    std::vector<StepDescriptor> leftoverRemovalSteps(DistroFamily family, StepPhase phase) const;

    void addRow(StrategyRow row);
    void setLeftoverRemoval(DistroFamily family, std::vector<StepDescriptor> steps);

private:
    std::vector<StrategyRow> m_rows;
    std::map<DistroFamily, std::vector<StepDescriptor>> m_leftovers;
};

} // namespace nvdm
