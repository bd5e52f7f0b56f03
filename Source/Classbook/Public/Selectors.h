#pragma once

#include "Classbook/Public/Types.h"
#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace Classbook::Selectors
{
    // -----------------------------------------------------------------------------
    //  Plain lookups over a roster. Returned pointers live as long as the roster.
    // -----------------------------------------------------------------------------

    namespace detail
    {
        template <typename Item, typename Id>
        const Item* findIn(const std::vector<Item>& items, const Id& id) noexcept
        {
            const auto it = std::find_if(items.begin(),
                                         items.end(),
                                         [&id](const Item& item)
                                         {
                                             return item.id == id;
                                         });

            return it != items.end() ? &(*it) : nullptr;
        }
    }

    inline const RosterMember* findMember(const Roster& roster, const RosterMemberId& id) noexcept
    {
        if (const auto* student = detail::findIn(roster.students, id))
            return student;

        return detail::findIn(roster.staff, id);
    }

    inline const Group* findGroup(const Roster& roster, const GroupId& id) noexcept
    {
        return detail::findIn(roster.groups, id);
    }

    inline const GroupSet* findGroupSet(const Roster& roster, const GroupSetId& id) noexcept
    {
        return detail::findIn(roster.groupSets, id);
    }

    inline const Assignment* findAssignment(const Roster& roster, const AssignmentId& id) noexcept
    {
        return detail::findIn(roster.assignments, id);
    }

    // Groups of a set in set order; dangling references are skipped.
    inline std::vector<const Group*> groupsOfSet(const Roster& roster, const GroupSetId& groupSetId)
    {
        std::vector<const Group*> groups;
        const auto* groupSet = findGroupSet(roster, groupSetId);
        if (groupSet == nullptr)
            return groups;

        groups.reserve(groupSet->groupIds.size());
        for (const auto& groupId : groupSet->groupIds)
        {
            if (const auto* group = findGroup(roster, groupId))
                groups.push_back(group);
        }

        return groups;
    }

    inline bool isGroupEditable(const Roster& roster, const GroupId& groupId) noexcept
    {
        const auto* group = findGroup(roster, groupId);
        return group != nullptr && isGroupUserEditable(group->origin);
    }

    inline bool isGroupSetEditable(const Roster& roster, const GroupSetId& groupSetId) noexcept
    {
        const auto* groupSet = findGroupSet(roster, groupSetId);
        return groupSet != nullptr && isGroupSetUserEditable(groupSet->connection);
    }

    // Number of group sets that list the group.
    inline int groupReferenceCount(const Roster& roster, const GroupId& groupId) noexcept
    {
        int count = 0;
        for (const auto& groupSet : roster.groupSets)
        {
            if (std::find(groupSet.groupIds.begin(), groupSet.groupIds.end(), groupId) != groupSet.groupIds.end())
                ++count;
        }

        return count;
    }

    inline const GroupSet* systemSet(const Roster& roster, SystemSetType type) noexcept
    {
        for (const auto& groupSet : roster.groupSets)
        {
            const auto systemType = systemTypeOf(groupSet);
            if (systemType.has_value() && *systemType == type)
                return &groupSet;
        }

        return nullptr;
    }

    inline std::vector<const GroupSet*> connectedGroupSets(const Roster& roster)
    {
        std::vector<const GroupSet*> sets;
        for (const auto& groupSet : roster.groupSets)
        {
            if (isLmsConnection(groupSet.connection))
                sets.push_back(&groupSet);
        }

        return sets;
    }

    // Sets the user owns: neither LMS-linked nor system.
    inline std::vector<const GroupSet*> localGroupSets(const Roster& roster)
    {
        std::vector<const GroupSet*> sets;
        for (const auto& groupSet : roster.groupSets)
        {
            if (!isLmsConnection(groupSet.connection) && !isSystemConnection(groupSet.connection))
                sets.push_back(&groupSet);
        }

        return sets;
    }

    inline std::vector<const Assignment*> assignmentsOfGroupSet(const Roster& roster, const GroupSetId& groupSetId)
    {
        std::vector<const Assignment*> assignments;
        for (const auto& assignment : roster.assignments)
        {
            if (assignment.groupSetId == groupSetId)
                assignments.push_back(&assignment);
        }

        return assignments;
    }

    // Local groups a member can be moved or copied into (those not already holding it).
    inline std::vector<const Group*> editableTargetGroups(const Roster& roster, const RosterMemberId& memberId)
    {
        std::vector<const Group*> targets;
        for (const auto& group : roster.groups)
        {
            if (!isGroupUserEditable(group.origin))
                continue;

            if (std::find(group.memberIds.begin(), group.memberIds.end(), memberId) != group.memberIds.end())
                continue;

            targets.push_back(&group);
        }

        return targets;
    }

    // Groups of the assignment's set filtered by its selection mode. Patterns are
    // case-insensitive globs over group names; exclusions apply in both modes.
    inline std::vector<const Group*> resolveAssignmentGroups(const Roster& roster, const Assignment& assignment)
    {
        auto groups = groupsOfSet(roster, assignment.groupSetId);
        const auto& selection = assignment.groupSelection;

        if (selection.kind == GroupSelectionMode::Kind::pattern)
        {
            const auto pattern = selection.pattern.trim();
            groups.erase(std::remove_if(groups.begin(),
                                        groups.end(),
                                        [&pattern](const Group* group)
                                        {
                                            return pattern.isEmpty() || !group->name.matchesWildcard(pattern, true);
                                        }),
                         groups.end());
        }

        if (!selection.excludedGroupIds.empty())
        {
            const std::set<GroupId> excluded(selection.excludedGroupIds.begin(), selection.excludedGroupIds.end());
            groups.erase(std::remove_if(groups.begin(),
                                        groups.end(),
                                        [&excluded](const Group* group)
                                        {
                                            return excluded.count(group->id) > 0;
                                        }),
                         groups.end());
        }

        return groups;
    }

    struct RosterCounts
    {
        int students = 0;
        int activeStudents = 0;
        int staff = 0;
        int groups = 0;
        int groupSets = 0;
        int assignments = 0;
    };

    inline RosterCounts countRoster(const Roster& roster)
    {
        RosterCounts counts;
        counts.students = static_cast<int>(roster.students.size());
        counts.activeStudents = static_cast<int>(std::count_if(roster.students.begin(),
                                                               roster.students.end(),
                                                               [](const RosterMember& member)
                                                               {
                                                                   return member.isActive();
                                                               }));
        counts.staff = static_cast<int>(roster.staff.size());
        counts.groups = static_cast<int>(roster.groups.size());
        counts.groupSets = static_cast<int>(roster.groupSets.size());
        counts.assignments = static_cast<int>(roster.assignments.size());
        return counts;
    }

    // -----------------------------------------------------------------------------
    //  RosterViews: filtered views memoized against document identity. A new
    //  document snapshot invalidates everything; the same snapshot is served from
    //  cache. The held snapshot keeps every returned pointer alive.
    // -----------------------------------------------------------------------------

    class RosterViews
    {
    public:
        void refresh(std::shared_ptr<const ProfileDocument> document)
        {
            if (document == source)
                return;

            source = std::move(document);
            connected.reset();
            local.reset();
            counts.reset();
            groupsBySet.clear();
            assignmentsBySet.clear();
        }

        const std::shared_ptr<const ProfileDocument>& getSource() const noexcept
        {
            return source;
        }

        const std::vector<const GroupSet*>& connectedGroupSets()
        {
            if (!connected.has_value())
            {
                ++recomputations;
                connected = roster() != nullptr ? Selectors::connectedGroupSets(*roster()) : std::vector<const GroupSet*> {};
            }

            return *connected;
        }

        const std::vector<const GroupSet*>& localGroupSets()
        {
            if (!local.has_value())
            {
                ++recomputations;
                local = roster() != nullptr ? Selectors::localGroupSets(*roster()) : std::vector<const GroupSet*> {};
            }

            return *local;
        }

        const std::vector<const Group*>& groupsOfSet(const GroupSetId& groupSetId)
        {
            auto it = groupsBySet.find(groupSetId);
            if (it == groupsBySet.end())
            {
                ++recomputations;
                auto groups = roster() != nullptr ? Selectors::groupsOfSet(*roster(), groupSetId) : std::vector<const Group*> {};
                it = groupsBySet.emplace(groupSetId, std::move(groups)).first;
            }

            return it->second;
        }

        const std::vector<const Assignment*>& assignmentsOfGroupSet(const GroupSetId& groupSetId)
        {
            auto it = assignmentsBySet.find(groupSetId);
            if (it == assignmentsBySet.end())
            {
                ++recomputations;
                auto assignments = roster() != nullptr ? Selectors::assignmentsOfGroupSet(*roster(), groupSetId)
                                                       : std::vector<const Assignment*> {};
                it = assignmentsBySet.emplace(groupSetId, std::move(assignments)).first;
            }

            return it->second;
        }

        const RosterCounts& rosterCounts()
        {
            if (!counts.has_value())
            {
                ++recomputations;
                counts = roster() != nullptr ? countRoster(*roster()) : RosterCounts {};
            }

            return *counts;
        }

        int getRecomputationCount() const noexcept
        {
            return recomputations;
        }

    private:
        const Roster* roster() const noexcept
        {
            if (source == nullptr || !source->roster.has_value())
                return nullptr;

            return &(*source->roster);
        }

        std::shared_ptr<const ProfileDocument> source;
        std::optional<std::vector<const GroupSet*>> connected;
        std::optional<std::vector<const GroupSet*>> local;
        std::optional<RosterCounts> counts;
        std::map<GroupSetId, std::vector<const Group*>> groupsBySet;
        std::map<GroupSetId, std::vector<const Assignment*>> assignmentsBySet;
        int recomputations = 0;
    };
}
