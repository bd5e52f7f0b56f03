#pragma once

#include "Classbook/Public/Types.h"

namespace Classbook::Core::SystemGroupSets
{
    const GroupSet* findSystemSet(const Roster& roster, SystemSetType type) noexcept;
    bool systemSetsMissing(const Roster& roster) noexcept;

    // Folds a synchronizer result into the roster:
    //  1. upsert groups by id
    //  2. delete groups (and their set references)
    //  3. upsert group sets by id
    //  4. keep one set per system type, preferring the ids this patch declares,
    //     then sweep orphaned groups
    void mergePatch(Roster& roster, const SystemGroupSetPatch& patch);

    // Keeps the first set per system type and sweeps the groups that only the
    // dropped sets referenced. Returns true when the roster changed.
    bool dedupeSystemSets(Roster& roster);
}
