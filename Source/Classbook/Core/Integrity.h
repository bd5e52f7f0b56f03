#pragma once

#include "Classbook/Public/Types.h"
#include <algorithm>
#include <optional>
#include <set>
#include <vector>

namespace Classbook::Core::Integrity
{
    // Cascades run inside reducer recipes, after the primary change and before the
    // patch is captured. Undo/redo only reaches the orphan sweep, through
    // SystemGroupSets::dedupeSystemSets.

    inline std::set<GroupId> collectReferencedGroupIds(const Roster& roster)
    {
        std::set<GroupId> referenced;
        for (const auto& groupSet : roster.groupSets)
            referenced.insert(groupSet.groupIds.begin(), groupSet.groupIds.end());

        return referenced;
    }

    inline void stripMemberFromGroups(Roster& roster, const RosterMemberId& memberId)
    {
        for (auto& group : roster.groups)
        {
            group.memberIds.erase(std::remove(group.memberIds.begin(), group.memberIds.end(), memberId),
                                  group.memberIds.end());
        }
    }

    inline void removeGroupEverywhere(Roster& roster, const GroupId& groupId)
    {
        roster.groups.erase(std::remove_if(roster.groups.begin(),
                                           roster.groups.end(),
                                           [&groupId](const Group& group)
                                           {
                                               return group.id == groupId;
                                           }),
                            roster.groups.end());

        for (auto& groupSet : roster.groupSets)
        {
            groupSet.groupIds.erase(std::remove(groupSet.groupIds.begin(), groupSet.groupIds.end(), groupId),
                                    groupSet.groupIds.end());
        }
    }

    // Returns the number of groups dropped.
    inline size_t sweepOrphanedGroups(Roster& roster)
    {
        const auto referenced = collectReferencedGroupIds(roster);
        const auto before = roster.groups.size();

        roster.groups.erase(std::remove_if(roster.groups.begin(),
                                           roster.groups.end(),
                                           [&referenced](const Group& group)
                                           {
                                               return referenced.count(group.id) == 0;
                                           }),
                            roster.groups.end());

        return before - roster.groups.size();
    }

    // Assignments that point at the removed set keep their dangling groupSetId; the
    // roster validator reports them.
    inline juce::Result removeGroupSet(Roster& roster, const GroupSetId& groupSetId)
    {
        const auto it = std::find_if(roster.groupSets.begin(),
                                     roster.groupSets.end(),
                                     [&groupSetId](const GroupSet& groupSet)
                                     {
                                         return groupSet.id == groupSetId;
                                     });

        if (it == roster.groupSets.end())
            return juce::Result::fail("Group set not found: " + groupSetId);

        if (!isGroupSetUserEditable(it->connection))
            return juce::Result::fail("System group sets cannot be deleted");

        const auto formerGroupIds = it->groupIds;
        roster.groupSets.erase(it);

        const auto stillReferenced = collectReferencedGroupIds(roster);
        std::set<GroupId> orphaned;
        for (const auto& groupId : formerGroupIds)
        {
            if (stillReferenced.count(groupId) == 0)
                orphaned.insert(groupId);
        }

        if (!orphaned.empty())
        {
            roster.groups.erase(std::remove_if(roster.groups.begin(),
                                               roster.groups.end(),
                                               [&orphaned](const Group& group)
                                               {
                                                   return orphaned.count(group.id) > 0;
                                               }),
                                roster.groups.end());
        }

        return juce::Result::ok();
    }

    inline std::optional<AssignmentId> defaultAssignmentSelection(const Roster* roster)
    {
        if (roster == nullptr || roster->assignments.empty())
            return std::nullopt;

        return roster->assignments.front().id;
    }

    // Keeps the current selection while it still names an assignment, else falls back
    // to the first assignment.
    inline std::optional<AssignmentId> reconcileAssignmentSelection(const Roster* roster,
                                                                    const std::optional<AssignmentId>& current)
    {
        if (current.has_value() && roster != nullptr)
        {
            const auto stillExists = std::any_of(roster->assignments.begin(),
                                                 roster->assignments.end(),
                                                 [&current](const Assignment& assignment)
                                                 {
                                                     return assignment.id == *current;
                                                 });
            if (stillExists)
                return current;
        }

        return defaultAssignmentSelection(roster);
    }
}
