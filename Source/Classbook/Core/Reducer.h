#pragma once

#include "Classbook/Public/Action.h"
#include "Classbook/Public/Types.h"
#include <optional>

namespace Classbook::Core::Reducer
{
    // Applies one action to a draft document. A failed result means the action was
    // refused (read-only target, missing id, no document); the caller must then
    // discard the draft, which may be partially modified.
    juce::Result apply(std::optional<ProfileDocument>& document, const Action& action);

    // History label for an action, resolved against the document it is about to be
    // applied to (names are looked up before the change).
    juce::String describe(const ProfileDocument* document, const Action& action);

    // "New Group Set", then "New Group Set (2)", "New Group Set (3)", ...
    juce::String nextNewGroupSetName(const Roster* roster);

    // Local and import sets hold local groups; LMS and system sets own their groups.
    bool acceptsLocalGroups(const GroupSetConnection& connection) noexcept;
}
