#pragma once

#include "Classbook/Public/Types.h"
#include <optional>
#include <variant>
#include <vector>

namespace Classbook
{
    // -----------------------------------------------------------------------------
    //  Patches
    //
    //  A committed change is stored as a list of forward patches plus a list of
    //  inverse patches (already in replay order). Collection edits are splices
    //  anchored on item ids, so a patch still lands correctly when the system
    //  set synchronizer has touched the roster between commit and undo. A roster
    //  import is recorded as one whole-roster replacement.
    // -----------------------------------------------------------------------------

    enum class RosterCollection
    {
        students,
        staff,
        groups,
        groupSets,
        assignments
    };

    // Document presence changed (null <-> document).
    struct ReplaceDocumentPatch
    {
        std::optional<ProfileDocument> document;
    };

    struct ReplaceSettingsPatch
    {
        ProfileSettings settings;
        GitIdentityMode resolvedIdentityMode = GitIdentityMode::username;
    };

    // Roster presence changed (null <-> roster), or the roster was replaced as a whole.
    struct ReplaceRosterPatch
    {
        std::optional<Roster> roster;
    };

    struct RosterConnectionPatch
    {
        std::optional<RosterConnection> connection;
    };

    template <typename Item>
    struct CollectionSplice
    {
        RosterCollection collection = RosterCollection::students;
        int index = 0;
        std::vector<Item> removed;
        std::vector<Item> inserted;
        juce::String anchorId; // first item after the splice, empty == end of collection
    };

    using MemberSplice = CollectionSplice<RosterMember>;
    using GroupSplice = CollectionSplice<Group>;
    using GroupSetSplice = CollectionSplice<GroupSet>;
    using AssignmentSplice = CollectionSplice<Assignment>;

    using Patch = std::variant<
        ReplaceDocumentPatch,
        ReplaceSettingsPatch,
        ReplaceRosterPatch,
        RosterConnectionPatch,
        MemberSplice,
        GroupSplice,
        GroupSetSplice,
        AssignmentSplice>;

    struct HistoryEntry
    {
        std::vector<Patch> patches;
        std::vector<Patch> inversePatches;
        juce::String description;
    };
}
