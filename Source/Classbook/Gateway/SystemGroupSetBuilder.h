#pragma once

#include "Classbook/Public/Services.h"
#include "Classbook/Public/Types.h"
#include <set>

namespace Classbook::Gateway::SystemGroupSetBuilder
{
    inline constexpr const char* kIndividualStudentsSetName = "Individual Students";
    inline constexpr const char* kStaffSetName = "Staff";

    // Lowercase ASCII slug: letters and digits kept, spaces and underscores folded
    // into single hyphens, everything else dropped.
    juce::String slugify(const juce::String& input);

    // "first_last" from the member's first and last name words, or
    // "member-<shortid>" when the name yields nothing.
    juce::String groupNameForMember(const RosterMember& member);

    // groupNameForMember, then "_<shortid>", then "-2", "-3"... until unused.
    juce::String uniqueGroupName(const RosterMember& member, const std::set<juce::String>& usedNames);

    // Computes the changes that bring the roster's system sets in line with its
    // membership. The roster itself is not modified.
    SystemGroupSetPatch buildPatch(const Roster& roster, IdentifierService& identifiers);
}
