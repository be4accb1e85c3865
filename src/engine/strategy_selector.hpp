#pragma once

#include "common/models.hpp"
#include "engine/step_table.hpp"

namespace nvdm {

class VersionCatalog;

// Maps a requested strategy and an environment to a concrete Strategy or
// throws a SelectionError subclass. Never runs privileged steps.
class StrategySelector {
public:
    explicit StrategySelector(VersionCatalog &catalog,
                              const StepTable &table = StepTable::builtin());

    Strategy select(StrategyKind kind, const EnvironmentSnapshot &snapshot) const;

private:
    VersionCatalog &m_catalog;
    const StepTable &m_table;
};

} // namespace nvdm
