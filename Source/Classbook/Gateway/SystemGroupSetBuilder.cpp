#include "Classbook/Gateway/SystemGroupSetBuilder.h"

#include "Classbook/Core/Integrity.h"
#include "Classbook/Public/Selectors.h"
#include <algorithm>
#include <map>

namespace
{
    using namespace Classbook;

    constexpr int kMaxSlugLength = 100;

    juce::StringArray nameWords(const juce::String& name)
    {
        auto words = juce::StringArray::fromTokens(name, false);
        words.removeEmptyStrings(true);
        return words;
    }

    juce::String shortId(const juce::String& id)
    {
        juce::String result;
        for (auto p = id.getCharPointer(); !p.isEmpty() && result.length() < 4; ++p)
        {
            const auto ch = *p;
            if (juce::CharacterFunctions::getHexDigitValue(ch) >= 0)
                result += juce::String::charToString(juce::CharacterFunctions::toLowerCase(ch));
        }

        return result;
    }

    std::vector<const RosterMember*> activeMembers(const std::vector<RosterMember>& members)
    {
        std::vector<const RosterMember*> active;
        for (const auto& member : members)
        {
            if (member.isActive())
                active.push_back(&member);
        }

        return active;
    }

    // One singleton group per active member, keyed by the member it holds.
    void syncSingletonSet(Roster& roster,
                          SystemSetType systemType,
                          const juce::String& setName,
                          const std::vector<const RosterMember*>& members,
                          IdentifierService& identifiers,
                          SystemGroupSetPatch& patch)
    {
        auto setIt = std::find_if(roster.groupSets.begin(),
                                  roster.groupSets.end(),
                                  [systemType](const GroupSet& groupSet)
                                  {
                                      const auto type = systemTypeOf(groupSet);
                                      return type.has_value() && *type == systemType;
                                  });

        if (setIt == roster.groupSets.end())
        {
            GroupSet created;
            created.id = identifiers.newId(IdKind::groupSet);
            created.name = setName;
            created.connection = SystemConnection { systemType };
            roster.groupSets.push_back(std::move(created));
            setIt = std::prev(roster.groupSets.end());
        }

        const auto setIndex = static_cast<size_t>(std::distance(roster.groupSets.begin(), setIt));
        const std::set<GroupId> setGroupIds(roster.groupSets[setIndex].groupIds.begin(),
                                            roster.groupSets[setIndex].groupIds.end());

        std::map<RosterMemberId, size_t> groupIndexByMember;
        std::set<juce::String> usedNames;
        for (size_t index = 0; index < roster.groups.size(); ++index)
        {
            const auto& group = roster.groups[index];
            if (setGroupIds.count(group.id) == 0)
                continue;

            usedNames.insert(group.name);
            if (group.origin == GroupOrigin::system && group.memberIds.size() == 1)
                groupIndexByMember.emplace(group.memberIds.front(), index);
        }

        std::vector<GroupId> neededIds;
        for (const auto* member : members)
        {
            const auto existing = groupIndexByMember.find(member->id);
            if (existing != groupIndexByMember.end())
            {
                auto& group = roster.groups[existing->second];
                usedNames.erase(group.name);

                const auto expectedName = Gateway::SystemGroupSetBuilder::uniqueGroupName(*member, usedNames);
                if (group.name != expectedName)
                {
                    group.name = expectedName;
                    patch.groupsUpserted.push_back(group);
                }

                usedNames.insert(expectedName);
                neededIds.push_back(group.id);
                continue;
            }

            Group group;
            group.id = identifiers.newId(IdKind::group);
            group.name = Gateway::SystemGroupSetBuilder::uniqueGroupName(*member, usedNames);
            group.memberIds = { member->id };
            group.origin = GroupOrigin::system;

            usedNames.insert(group.name);
            neededIds.push_back(group.id);
            patch.groupsUpserted.push_back(group);
            roster.groups.push_back(std::move(group));
        }

        const auto previousIds = roster.groupSets[setIndex].groupIds;
        for (const auto& groupId : previousIds)
        {
            if (std::find(neededIds.begin(), neededIds.end(), groupId) != neededIds.end())
                continue;

            if (Selectors::findGroup(roster, groupId) != nullptr)
                patch.deletedGroupIds.push_back(groupId);

            Core::Integrity::removeGroupEverywhere(roster, groupId);
        }

        roster.groupSets[setIndex].groupIds = std::move(neededIds);
        patch.groupSets.push_back(roster.groupSets[setIndex]);
    }

    // Non-system groups lose members that were deleted or are no longer active.
    void stripInactiveMembers(Roster& roster, SystemGroupSetPatch& patch)
    {
        std::set<RosterMemberId> activeIds;
        for (const auto* members : { &roster.students, &roster.staff })
        {
            for (const auto& member : *members)
            {
                if (member.isActive())
                    activeIds.insert(member.id);
            }
        }

        for (auto& group : roster.groups)
        {
            if (group.origin == GroupOrigin::system)
                continue;

            const auto before = group.memberIds.size();
            group.memberIds.erase(std::remove_if(group.memberIds.begin(),
                                                 group.memberIds.end(),
                                                 [&activeIds](const RosterMemberId& memberId)
                                                 {
                                                     return activeIds.count(memberId) == 0;
                                                 }),
                                  group.memberIds.end());

            if (group.memberIds.size() != before)
                patch.groupsUpserted.push_back(group);
        }
    }
}

namespace Classbook::Gateway::SystemGroupSetBuilder
{
    juce::String slugify(const juce::String& input)
    {
        const auto lower = input.toLowerCase();
        juce::String output;
        bool lastWasHyphen = false;

        for (auto p = lower.getCharPointer(); !p.isEmpty(); ++p)
        {
            auto ch = *p;
            if (ch == ' ' || ch == '_')
                ch = '-';

            if (ch < 128 && juce::CharacterFunctions::isLetterOrDigit(ch))
            {
                output += juce::String::charToString(ch);
                lastWasHyphen = false;
            }
            else if (ch == '-' && !lastWasHyphen)
            {
                output += "-";
                lastWasHyphen = true;
            }
        }

        output = output.trimCharactersAtStart("-").trimCharactersAtEnd("-");
        if (output.length() > kMaxSlugLength)
            output = output.substring(0, kMaxSlugLength).trimCharactersAtEnd("-");

        return output;
    }

    juce::String groupNameForMember(const RosterMember& member)
    {
        const auto words = nameWords(member.name);
        const auto first = words.isEmpty() ? juce::String() : slugify(words[0]);
        const auto last = words.isEmpty() ? juce::String() : slugify(words[words.size() - 1]);

        if (first.isEmpty() && last.isEmpty())
            return "member-" + shortId(member.id);
        if (first.isEmpty())
            return last;
        if (last.isEmpty())
            return first;

        return first + "_" + last;
    }

    juce::String uniqueGroupName(const RosterMember& member, const std::set<juce::String>& usedNames)
    {
        const auto baseName = groupNameForMember(member);
        if (usedNames.count(baseName) == 0)
            return baseName;

        const auto suffix = shortId(member.id);
        if (suffix.isNotEmpty())
        {
            const auto withId = baseName + "_" + suffix;
            if (usedNames.count(withId) == 0)
                return withId;
        }

        for (int counter = 2;; ++counter)
        {
            const auto numbered = baseName + "-" + juce::String(counter);
            if (usedNames.count(numbered) == 0)
                return numbered;
        }
    }

    SystemGroupSetPatch buildPatch(const Roster& input, IdentifierService& identifiers)
    {
        auto roster = input;
        SystemGroupSetPatch patch;

        syncSingletonSet(roster,
                         SystemSetType::individualStudents,
                         kIndividualStudentsSetName,
                         activeMembers(roster.students),
                         identifiers,
                         patch);

        syncSingletonSet(roster,
                         SystemSetType::staff,
                         kStaffSetName,
                         activeMembers(roster.staff),
                         identifiers,
                         patch);

        stripInactiveMembers(roster, patch);
        return patch;
    }
}
