#pragma once

#include "Classbook/Core/SystemGroupSets.h"
#include "Classbook/Public/Selectors.h"
#include "Classbook/Public/Types.h"
#include <map>
#include <set>
#include <vector>

namespace Classbook::Gateway::RosterValidator
{
    inline juce::String normalizeEmail(const juce::String& email)
    {
        return email.trim().toLowerCase();
    }

    // Collapses runs of whitespace so "Lab  1" and "lab 1" compare equal.
    inline juce::String normalizeName(const juce::String& name)
    {
        auto tokens = juce::StringArray::fromTokens(name, false);
        tokens.removeEmptyStrings(true);
        return tokens.joinIntoString(" ").toLowerCase();
    }

    // One '@', a non-empty local part without spaces, and a domain with a dot that is
    // neither its first nor its last character.
    inline bool isValidEmail(const juce::String& email)
    {
        const auto trimmed = email.trim();
        const auto at = trimmed.indexOfChar('@');
        if (at <= 0 || trimmed.indexOfChar(at + 1, '@') >= 0)
            return false;

        const auto local = trimmed.substring(0, at);
        const auto domain = trimmed.substring(at + 1);
        if (domain.isEmpty())
            return false;

        const auto dot = domain.lastIndexOfChar('.');
        return dot > 0 && dot < domain.length() - 1 && !local.containsChar(' ');
    }

    // Sorted values that occur more than once.
    inline std::vector<juce::String> findDuplicates(const std::vector<juce::String>& values)
    {
        std::set<juce::String> seen;
        std::set<juce::String> duplicates;
        for (const auto& value : values)
        {
            if (!seen.insert(value).second)
                duplicates.insert(value);
        }

        return { duplicates.begin(), duplicates.end() };
    }

    namespace detail
    {
        inline void addIssue(ValidationResult& result,
                             ValidationKind kind,
                             std::vector<juce::String> affectedIds,
                             std::optional<juce::String> context = std::nullopt)
        {
            if (affectedIds.empty() && kind != ValidationKind::systemGroupSetsMissing)
                return;

            ValidationIssue issue;
            issue.kind = kind;
            issue.affectedIds = std::move(affectedIds);
            issue.context = std::move(context);
            result.issues.push_back(std::move(issue));
        }

        inline bool originMatchesConnection(const Group& group, const GroupSetConnection& connection)
        {
            return std::visit([&group](const auto& typed) -> bool
                              {
                                  using T = std::decay_t<decltype(typed)>;
                                  if constexpr (std::is_same_v<T, LocalConnection>)
                                      return true;
                                  else if constexpr (std::is_same_v<T, ImportConnection>)
                                      return group.origin == GroupOrigin::local && !group.lmsGroupId.has_value();
                                  else if constexpr (std::is_same_v<T, CanvasConnection>)
                                      return group.origin == GroupOrigin::lms;
                                  else if constexpr (std::is_same_v<T, MoodleConnection>)
                                      return group.origin == GroupOrigin::lms;
                                  else if constexpr (std::is_same_v<T, SystemConnection>)
                                      return group.origin == GroupOrigin::system;
                                  else
                                      static_assert(kAlwaysFalse<T>, "unhandled group set connection");
                              },
                              connection);
        }
    }

    inline ValidationResult validateRoster(const Roster& roster)
    {
        ValidationResult result;

        if (Core::SystemGroupSets::systemSetsMissing(roster))
            detail::addIssue(result,
                             ValidationKind::systemGroupSetsMissing,
                             {},
                             juce::String("System group sets have not been created yet"));

        std::vector<juce::String> memberIds;
        for (const auto& member : roster.students)
            memberIds.push_back(member.id);
        for (const auto& member : roster.staff)
            memberIds.push_back(member.id);
        detail::addIssue(result, ValidationKind::duplicateStudentId, findDuplicates(memberIds));

        std::vector<juce::String> missingEmails;
        std::vector<juce::String> invalidEmails;
        std::vector<juce::String> emails;
        for (const auto& student : roster.students)
        {
            if (student.email.trim().isEmpty())
            {
                missingEmails.push_back(student.id);
                continue;
            }

            if (!isValidEmail(student.email))
                invalidEmails.push_back(student.id);

            emails.push_back(normalizeEmail(student.email));
        }

        detail::addIssue(result, ValidationKind::missingEmail, std::move(missingEmails));
        detail::addIssue(result, ValidationKind::invalidEmail, std::move(invalidEmails));
        detail::addIssue(result, ValidationKind::duplicateEmail, findDuplicates(emails));

        std::vector<juce::String> assignmentNames;
        for (const auto& assignment : roster.assignments)
            assignmentNames.push_back(normalizeName(assignment.name));
        detail::addIssue(result, ValidationKind::duplicateAssignmentName, findDuplicates(assignmentNames));

        std::vector<juce::String> groupIds;
        for (const auto& group : roster.groups)
            groupIds.push_back(group.id);
        detail::addIssue(result,
                         ValidationKind::duplicateGroupIdInAssignment,
                         findDuplicates(groupIds),
                         juce::String("Duplicate group IDs in roster"));

        for (const auto& groupSet : roster.groupSets)
        {
            std::vector<juce::String> danglingIds;
            for (const auto& groupId : groupSet.groupIds)
            {
                if (Selectors::findGroup(roster, groupId) == nullptr)
                    danglingIds.push_back(groupId);
            }

            detail::addIssue(result,
                             ValidationKind::orphanGroupMember,
                             std::move(danglingIds),
                             "Group set '" + groupSet.name + "' references non-existent groups");
        }

        std::vector<juce::String> nonStudents;
        for (const auto& member : roster.students)
        {
            if (!member.isStudent())
                nonStudents.push_back(member.id);
        }
        detail::addIssue(result,
                         ValidationKind::invalidEnrollmentPartition,
                         std::move(nonStudents),
                         juce::String("Non-students in students list"));

        std::vector<juce::String> studentsInStaff;
        for (const auto& member : roster.staff)
        {
            if (member.isStudent())
                studentsInStaff.push_back(member.id);
        }
        detail::addIssue(result,
                         ValidationKind::invalidEnrollmentPartition,
                         std::move(studentsInStaff),
                         juce::String("Students in staff list"));

        const std::set<juce::String> knownMembers(memberIds.begin(), memberIds.end());
        for (const auto& group : roster.groups)
        {
            std::vector<juce::String> unknownMembers;
            for (const auto& memberId : group.memberIds)
            {
                if (knownMembers.count(memberId) == 0)
                    unknownMembers.push_back(memberId);
            }

            detail::addIssue(result,
                             ValidationKind::orphanGroupMember,
                             std::move(unknownMembers),
                             "Group '" + group.name + "' references non-existent members");
        }

        for (const auto& groupSet : roster.groupSets)
        {
            for (const auto& groupId : groupSet.groupIds)
            {
                const auto* group = Selectors::findGroup(roster, groupId);
                if (group == nullptr || detail::originMatchesConnection(*group, groupSet.connection))
                    continue;

                detail::addIssue(result,
                                 ValidationKind::invalidGroupOrigin,
                                 { group->id },
                                 "Group '" + group->name + "' has origin '" + groupOriginToKey(group->origin)
                                     + "' but group set '" + groupSet.name + "' expects a different origin");
            }
        }

        for (const auto& assignment : roster.assignments)
        {
            if (Selectors::findGroupSet(roster, assignment.groupSetId) == nullptr)
                detail::addIssue(result,
                                 ValidationKind::missingGroupSet,
                                 { assignment.id },
                                 "Assignment '" + assignment.name + "' references a deleted group set");
        }

        return result;
    }

    inline ValidationResult validateAssignment(const Roster& roster,
                                               const AssignmentId& assignmentId,
                                               GitIdentityMode identityMode)
    {
        ValidationResult result;

        const auto* assignment = Selectors::findAssignment(roster, assignmentId);
        if (assignment == nullptr)
            return result;

        const auto groups = Selectors::resolveAssignmentGroups(roster, *assignment);

        std::vector<juce::String> groupNames;
        for (const auto* group : groups)
            groupNames.push_back(normalizeName(group->name));
        detail::addIssue(result, ValidationKind::duplicateGroupNameInAssignment, findDuplicates(groupNames));

        std::map<RosterMemberId, int> groupCountByMember;
        std::set<GroupId> emptyGroups;
        std::set<RosterMemberId> missingUsernames;
        std::set<RosterMemberId> invalidUsernames;

        for (const auto* group : groups)
        {
            if (group->memberIds.empty())
                emptyGroups.insert(group->id);

            for (const auto& memberId : group->memberIds)
            {
                const auto* member = Selectors::findMember(roster, memberId);
                if (member == nullptr || !member->isActive())
                    continue;

                ++groupCountByMember[memberId];

                if (identityMode != GitIdentityMode::username)
                    continue;

                const auto username = member->gitUsername.value_or(juce::String()).trim();
                if (username.isEmpty())
                    missingUsernames.insert(memberId);
                else if (member->gitUsernameStatus == GitUsernameStatus::invalid)
                    invalidUsernames.insert(memberId);
            }
        }

        std::vector<juce::String> inMultipleGroups;
        for (const auto& [memberId, count] : groupCountByMember)
        {
            if (count > 1)
                inMultipleGroups.push_back(memberId);
        }

        detail::addIssue(result, ValidationKind::studentInMultipleGroupsInAssignment, std::move(inMultipleGroups));
        detail::addIssue(result, ValidationKind::emptyGroup, { emptyGroups.begin(), emptyGroups.end() });
        detail::addIssue(result, ValidationKind::missingGitUsername, { missingUsernames.begin(), missingUsernames.end() });
        detail::addIssue(result, ValidationKind::invalidGitUsername, { invalidUsernames.begin(), invalidUsernames.end() });

        if (assignment->assignmentType == AssignmentType::classWide)
        {
            std::set<RosterMemberId> unassigned;
            for (const auto& student : roster.students)
            {
                if (student.isActive() && groupCountByMember.count(student.id) == 0)
                    unassigned.insert(student.id);
            }

            detail::addIssue(result,
                             ValidationKind::studentMissingFromAssignment,
                             { unassigned.begin(), unassigned.end() });
        }

        return result;
    }
}
