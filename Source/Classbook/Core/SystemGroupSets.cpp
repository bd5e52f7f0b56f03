#include "Classbook/Core/SystemGroupSets.h"

#include "Classbook/Core/Integrity.h"
#include <algorithm>
#include <map>
#include <set>

namespace
{
    using namespace Classbook;

    template <typename Item>
    void upsertById(std::vector<Item>& items, const Item& item)
    {
        const auto it = std::find_if(items.begin(),
                                     items.end(),
                                     [&item](const Item& candidate)
                                     {
                                         return candidate.id == item.id;
                                     });

        if (it != items.end())
            *it = item;
        else
            items.push_back(item);
    }

    // Sets whose type has no preferred id keep their first occurrence.
    bool keepOneSetPerType(Roster& roster, std::map<SystemSetType, GroupSetId> preferredIdByType)
    {
        for (const auto& groupSet : roster.groupSets)
        {
            if (const auto systemType = systemTypeOf(groupSet))
                preferredIdByType.emplace(*systemType, groupSet.id);
        }

        const auto before = roster.groupSets.size();
        std::set<SystemSetType> seenTypes;
        roster.groupSets.erase(std::remove_if(roster.groupSets.begin(),
                                              roster.groupSets.end(),
                                              [&](const GroupSet& groupSet)
                                              {
                                                  const auto systemType = systemTypeOf(groupSet);
                                                  if (!systemType.has_value())
                                                      return false;

                                                  if (preferredIdByType[*systemType] != groupSet.id)
                                                      return true;

                                                  return !seenTypes.insert(*systemType).second;
                                              }),
                               roster.groupSets.end());

        return roster.groupSets.size() != before;
    }
}

namespace Classbook::Core::SystemGroupSets
{
    const GroupSet* findSystemSet(const Roster& roster, SystemSetType type) noexcept
    {
        for (const auto& groupSet : roster.groupSets)
        {
            const auto systemType = systemTypeOf(groupSet);
            if (systemType.has_value() && *systemType == type)
                return &groupSet;
        }

        return nullptr;
    }

    bool systemSetsMissing(const Roster& roster) noexcept
    {
        return findSystemSet(roster, SystemSetType::individualStudents) == nullptr
            || findSystemSet(roster, SystemSetType::staff) == nullptr;
    }

    void mergePatch(Roster& roster, const SystemGroupSetPatch& patch)
    {
        for (const auto& group : patch.groupsUpserted)
            upsertById(roster.groups, group);

        for (const auto& groupId : patch.deletedGroupIds)
            Integrity::removeGroupEverywhere(roster, groupId);

        for (const auto& groupSet : patch.groupSets)
            upsertById(roster.groupSets, groupSet);

        std::map<SystemSetType, GroupSetId> preferredIdByType;
        for (const auto& groupSet : patch.groupSets)
        {
            if (const auto systemType = systemTypeOf(groupSet))
                preferredIdByType[*systemType] = groupSet.id;
        }

        keepOneSetPerType(roster, std::move(preferredIdByType));

        const auto dropped = Integrity::sweepOrphanedGroups(roster);
        if (dropped > 0)
        {
            DBG("[Classbook][SystemSets] swept " + juce::String(static_cast<int>(dropped)) + " orphaned group(s)");
        }
    }

    bool dedupeSystemSets(Roster& roster)
    {
        if (!keepOneSetPerType(roster, {}))
            return false;

        const auto dropped = Integrity::sweepOrphanedGroups(roster);
        juce::ignoreUnused(dropped);
        DBG("[Classbook][SystemSets] dropped duplicate system set(s), swept "
            + juce::String(static_cast<int>(dropped)) + " orphaned group(s)");
        return true;
    }
}
