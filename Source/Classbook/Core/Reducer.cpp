#include "Classbook/Core/Reducer.h"

#include "Classbook/Core/Integrity.h"
#include <algorithm>
#include <set>

namespace
{
    using namespace Classbook;

    template <typename Collection, typename Id>
    auto findById(Collection& items, const Id& id) -> decltype(&items.front())
    {
        const auto it = std::find_if(items.begin(),
                                     items.end(),
                                     [&id](const auto& item)
                                     {
                                         return item.id == id;
                                     });

        return it != items.end() ? &(*it) : nullptr;
    }

    template <typename Collection, typename Id>
    bool eraseById(Collection& items, const Id& id)
    {
        const auto before = items.size();
        items.erase(std::remove_if(items.begin(),
                                   items.end(),
                                   [&id](const auto& item)
                                   {
                                       return item.id == id;
                                   }),
                    items.end());
        return items.size() != before;
    }

    template <typename Value>
    void appendUnique(std::vector<Value>& values, const Value& value)
    {
        if (std::find(values.begin(), values.end(), value) == values.end())
            values.push_back(value);
    }

    template <typename Value>
    void eraseValue(std::vector<Value>& values, const Value& value)
    {
        values.erase(std::remove(values.begin(), values.end(), value), values.end());
    }

    const RosterMember* findMember(const Roster& roster, const RosterMemberId& id) noexcept
    {
        if (const auto* student = findById(roster.students, id))
            return student;

        return findById(roster.staff, id);
    }

    bool memberExists(const Roster& roster, const RosterMemberId& id) noexcept
    {
        return findMember(roster, id) != nullptr;
    }

    const Roster* rosterOf(const ProfileDocument* document) noexcept
    {
        if (document == nullptr || !document->roster.has_value())
            return nullptr;

        return &(*document->roster);
    }

    juce::String memberNameOr(const ProfileDocument* document, const RosterMemberId& id, const juce::String& fallback)
    {
        if (const auto* roster = rosterOf(document))
        {
            if (const auto* member = findMember(*roster, id))
                return member->name;
        }

        return fallback;
    }

    juce::String assignmentNameOr(const ProfileDocument* document, const AssignmentId& id)
    {
        if (const auto* roster = rosterOf(document))
        {
            if (const auto* assignment = findById(roster->assignments, id))
                return assignment->name;
        }

        return "assignment";
    }

    juce::String groupSetNameOr(const ProfileDocument* document, const GroupSetId& id)
    {
        if (const auto* roster = rosterOf(document))
        {
            if (const auto* groupSet = findById(roster->groupSets, id))
                return groupSet->name;
        }

        return "group set";
    }

    Roster makeRosterWithMember(const RosterMember& member)
    {
        Roster roster;
        if (member.isStudent())
            roster.students.push_back(member);
        else
            roster.staff.push_back(member);

        return roster;
    }

    void applyMemberUpdate(RosterMember& member, const RosterMemberUpdate& update)
    {
        if (update.name.has_value()) member.name = *update.name;
        if (update.email.has_value()) member.email = *update.email;
        if (update.studentNumber.has_value()) member.studentNumber = *update.studentNumber;
        if (update.gitUsername.has_value()) member.gitUsername = *update.gitUsername;
        if (update.gitUsernameStatus.has_value()) member.gitUsernameStatus = *update.gitUsernameStatus;
        if (update.status.has_value()) member.status = *update.status;
        if (update.lmsUserId.has_value()) member.lmsUserId = *update.lmsUserId;
        if (update.enrollmentType.has_value()) member.enrollmentType = *update.enrollmentType;
        if (update.enrollmentDisplay.has_value()) member.enrollmentDisplay = *update.enrollmentDisplay;
        if (update.source.has_value()) member.source = *update.source;
    }

    void applyAssignmentUpdate(Assignment& assignment, const AssignmentUpdate& update)
    {
        if (update.name.has_value()) assignment.name = *update.name;
        if (update.description.has_value()) assignment.description = *update.description;
        if (update.assignmentType.has_value()) assignment.assignmentType = *update.assignmentType;
        if (update.groupSetId.has_value()) assignment.groupSetId = *update.groupSetId;
        if (update.groupSelection.has_value()) assignment.groupSelection = *update.groupSelection;
    }

    juce::Result requireRoster(std::optional<ProfileDocument>& document, Roster*& rosterOut)
    {
        if (!document.has_value())
            return juce::Result::fail("No document loaded");
        if (!document->roster.has_value())
            return juce::Result::fail("No roster loaded");

        rosterOut = &(*document->roster);
        return juce::Result::ok();
    }

    // Strips the member from the move source, when it is a local group.
    void detachFromMoveSource(Roster& roster,
                              const RosterMemberId& memberId,
                              MemberTransfer transfer,
                              const std::optional<GroupId>& sourceGroupId)
    {
        if (transfer != MemberTransfer::move || !sourceGroupId.has_value())
            return;

        auto* source = findById(roster.groups, *sourceGroupId);
        if (source != nullptr && isGroupUserEditable(source->origin))
            eraseValue(source->memberIds, memberId);
    }
}

namespace Classbook::Core::Reducer
{
    bool acceptsLocalGroups(const GroupSetConnection& connection) noexcept
    {
        return std::visit([](const auto& typed) -> bool
                          {
                              using T = std::decay_t<decltype(typed)>;
                              if constexpr (std::is_same_v<T, LocalConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, ImportConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, CanvasConnection>)
                                  return false;
                              else if constexpr (std::is_same_v<T, MoodleConnection>)
                                  return false;
                              else if constexpr (std::is_same_v<T, SystemConnection>)
                                  return false;
                              else
                                  static_assert(kAlwaysFalse<T>, "unhandled group set connection");
                          },
                          connection);
    }

    juce::String nextNewGroupSetName(const Roster* roster)
    {
        const juce::String baseName = "New Group Set";

        std::set<juce::String> existingNames;
        if (roster != nullptr)
        {
            for (const auto& groupSet : roster->groupSets)
                existingNames.insert(groupSet.name);
        }

        auto name = baseName;
        for (int counter = 2; existingNames.count(name) > 0; ++counter)
            name = baseName + " (" + juce::String(counter) + ")";

        return name;
    }

    juce::String describe(const ProfileDocument* document, const Action& action)
    {
        return std::visit([document](const auto& typedAction) -> juce::String
                          {
                              using T = std::decay_t<decltype(typedAction)>;

                              if constexpr (std::is_same_v<T, AddMemberAction>)
                                  return "Add member " + typedAction.member.name;
                              else if constexpr (std::is_same_v<T, UpdateMemberAction>)
                                  return "Edit member " + memberNameOr(document, typedAction.id, "member");
                              else if constexpr (std::is_same_v<T, RemoveMemberAction>)
                                  return "Remove member " + memberNameOr(document, typedAction.id, "member");
                              else if constexpr (std::is_same_v<T, AddAssignmentAction>)
                                  return "Add assignment " + typedAction.assignment.name;
                              else if constexpr (std::is_same_v<T, UpdateAssignmentAction>)
                                  return "Edit assignment " + assignmentNameOr(document, typedAction.id);
                              else if constexpr (std::is_same_v<T, DeleteAssignmentAction>)
                                  return "Delete assignment " + assignmentNameOr(document, typedAction.id);
                              else if constexpr (std::is_same_v<T, CreateGroupAction>)
                                  return "Create group " + typedAction.name;
                              else if constexpr (std::is_same_v<T, UpdateGroupAction>)
                                  return "Edit group";
                              else if constexpr (std::is_same_v<T, DeleteGroupAction>)
                                  return "Delete group";
                              else if constexpr (std::is_same_v<T, AddGroupToSetAction>)
                                  return "Add group to set";
                              else if constexpr (std::is_same_v<T, RemoveGroupFromSetAction>)
                                  return "Remove group from set";
                              else if constexpr (std::is_same_v<T, MoveMemberToGroupAction>)
                                  return "Move member to group";
                              else if constexpr (std::is_same_v<T, CopyMemberToGroupAction>)
                                  return "Copy member to group";
                              else if constexpr (std::is_same_v<T, CreateGroupSetWithMemberAction>)
                              {
                                  const juce::String verb = typedAction.transfer == MemberTransfer::move ? "Move" : "Copy";
                                  return verb + " member to new group set \"" + typedAction.groupSetName + "\"";
                              }
                              else if constexpr (std::is_same_v<T, CreateGroupInSetWithMemberAction>)
                              {
                                  const juce::String verb = typedAction.transfer == MemberTransfer::move ? "Move" : "Copy";
                                  return verb + " member to new group \""
                                       + memberNameOr(document, typedAction.memberId, "member") + "\"";
                              }
                              else if constexpr (std::is_same_v<T, CreateLocalGroupSetAction>)
                                  return "Create group set " + typedAction.name.trim();
                              else if constexpr (std::is_same_v<T, CopyGroupSetAction>)
                                  return "Copy group set " + groupSetNameOr(document, typedAction.sourceId);
                              else if constexpr (std::is_same_v<T, RenameGroupSetAction>)
                                  return "Rename group set " + typedAction.name.trim();
                              else if constexpr (std::is_same_v<T, DeleteGroupSetAction>)
                                  return "Delete group set";
                              else if constexpr (std::is_same_v<T, SetRosterAction>)
                                  return typedAction.description;
                              else if constexpr (std::is_same_v<T, CleanupOrphanedGroupsAction>)
                                  return "Cleanup orphaned groups";
                              else if constexpr (std::is_same_v<T, SetCourseAction>)
                                  return "Set course";
                              else if constexpr (std::is_same_v<T, SetCourseVerifiedAtAction>)
                                  return "Set course verification";
                              else if constexpr (std::is_same_v<T, SetGitConnectionAction>)
                                  return "Change git connection";
                              else if constexpr (std::is_same_v<T, SetOperationsAction>)
                                  return "Edit operations";
                              else if constexpr (std::is_same_v<T, SetExportsAction>)
                                  return "Edit exports";
                              else
                                  static_assert(kAlwaysFalse<T>, "unhandled document action");
                          },
                          action);
    }

    juce::Result apply(std::optional<ProfileDocument>& document, const Action& action)
    {
        const auto validation = validateAction(action);
        if (validation.failed())
            return validation;

        return std::visit([&document](const auto& typedAction) -> juce::Result
                          {
                              using T = std::decay_t<decltype(typedAction)>;

                              if constexpr (std::is_same_v<T, AddMemberAction>)
                              {
                                  const auto& member = typedAction.member;

                                  if (!document.has_value())
                                  {
                                      ProfileDocument created;
                                      created.roster = makeRosterWithMember(member);
                                      document = std::move(created);
                                      return juce::Result::ok();
                                  }

                                  if (!document->roster.has_value())
                                  {
                                      document->roster = makeRosterWithMember(member);
                                      return juce::Result::ok();
                                  }

                                  auto& roster = *document->roster;
                                  if (memberExists(roster, member.id))
                                      return juce::Result::fail("Member id already exists: " + member.id);

                                  if (member.isStudent())
                                      roster.students.push_back(member);
                                  else
                                      roster.staff.push_back(member);

                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, UpdateMemberAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* inStudents = findById(roster->students, typedAction.id);
                                  auto* inStaff = inStudents == nullptr ? findById(roster->staff, typedAction.id) : nullptr;
                                  if (inStudents == nullptr && inStaff == nullptr)
                                      return juce::Result::fail("Member not found: " + typedAction.id);

                                  auto updated = inStudents != nullptr ? *inStudents : *inStaff;
                                  applyMemberUpdate(updated, typedAction.update);

                                  if (inStudents != nullptr && !updated.isStudent())
                                  {
                                      eraseById(roster->students, typedAction.id);
                                      roster->staff.push_back(std::move(updated));
                                  }
                                  else if (inStaff != nullptr && updated.isStudent())
                                  {
                                      eraseById(roster->staff, typedAction.id);
                                      roster->students.push_back(std::move(updated));
                                  }
                                  else if (inStudents != nullptr)
                                  {
                                      *inStudents = std::move(updated);
                                  }
                                  else
                                  {
                                      *inStaff = std::move(updated);
                                  }

                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, RemoveMemberAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  const auto removedStudent = eraseById(roster->students, typedAction.id);
                                  const auto removedStaff = eraseById(roster->staff, typedAction.id);
                                  if (!removedStudent && !removedStaff)
                                      return juce::Result::fail("Member not found: " + typedAction.id);

                                  Integrity::stripMemberFromGroups(*roster, typedAction.id);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, AddAssignmentAction>)
                              {
                                  if (!document.has_value())
                                      return juce::Result::fail("No document loaded");

                                  if (!document->roster.has_value())
                                      document->roster = Roster {};

                                  auto& roster = *document->roster;
                                  if (findById(roster.assignments, typedAction.assignment.id) != nullptr)
                                      return juce::Result::fail("Assignment id already exists: " + typedAction.assignment.id);

                                  roster.assignments.push_back(typedAction.assignment);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, UpdateAssignmentAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* assignment = findById(roster->assignments, typedAction.id);
                                  if (assignment == nullptr)
                                      return juce::Result::fail("Assignment not found: " + typedAction.id);

                                  applyAssignmentUpdate(*assignment, typedAction.update);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, DeleteAssignmentAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  if (!eraseById(roster->assignments, typedAction.id))
                                      return juce::Result::fail("Assignment not found: " + typedAction.id);

                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CreateGroupAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* groupSet = findById(roster->groupSets, typedAction.groupSetId);
                                  if (groupSet == nullptr)
                                      return juce::Result::fail("Group set not found: " + typedAction.groupSetId);
                                  if (!acceptsLocalGroups(groupSet->connection))
                                      return juce::Result::fail("Group set does not accept local groups");
                                  if (findById(roster->groups, typedAction.groupId) != nullptr)
                                      return juce::Result::fail("Group id already exists: " + typedAction.groupId);

                                  Group group;
                                  group.id = typedAction.groupId;
                                  group.name = typedAction.name;
                                  group.origin = GroupOrigin::local;
                                  for (const auto& memberId : typedAction.memberIds)
                                  {
                                      if (memberExists(*roster, memberId))
                                          appendUnique(group.memberIds, memberId);
                                  }

                                  groupSet->groupIds.push_back(group.id);
                                  roster->groups.push_back(std::move(group));
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, UpdateGroupAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* group = findById(roster->groups, typedAction.id);
                                  if (group == nullptr)
                                      return juce::Result::fail("Group not found: " + typedAction.id);
                                  if (!isGroupUserEditable(group->origin))
                                      return juce::Result::fail("Group is read-only: " + group->name);

                                  if (typedAction.update.name.has_value())
                                      group->name = *typedAction.update.name;

                                  if (typedAction.update.memberIds.has_value())
                                  {
                                      std::vector<RosterMemberId> memberIds;
                                      for (const auto& memberId : *typedAction.update.memberIds)
                                      {
                                          if (memberExists(*roster, memberId))
                                              appendUnique(memberIds, memberId);
                                      }

                                      group->memberIds = std::move(memberIds);
                                  }

                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, DeleteGroupAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  const auto* group = findById(roster->groups, typedAction.id);
                                  if (group == nullptr)
                                      return juce::Result::fail("Group not found: " + typedAction.id);
                                  if (group->origin == GroupOrigin::system)
                                      return juce::Result::fail("System groups cannot be deleted");

                                  Integrity::removeGroupEverywhere(*roster, typedAction.id);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, AddGroupToSetAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* groupSet = findById(roster->groupSets, typedAction.groupSetId);
                                  if (groupSet == nullptr)
                                      return juce::Result::fail("Group set not found: " + typedAction.groupSetId);
                                  if (!acceptsLocalGroups(groupSet->connection))
                                      return juce::Result::fail("Group set membership is read-only");
                                  if (findById(roster->groups, typedAction.groupId) == nullptr)
                                      return juce::Result::fail("Group not found: " + typedAction.groupId);

                                  appendUnique(groupSet->groupIds, typedAction.groupId);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, RemoveGroupFromSetAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* groupSet = findById(roster->groupSets, typedAction.groupSetId);
                                  if (groupSet == nullptr)
                                      return juce::Result::fail("Group set not found: " + typedAction.groupSetId);
                                  if (!acceptsLocalGroups(groupSet->connection))
                                      return juce::Result::fail("Group set membership is read-only");

                                  eraseValue(groupSet->groupIds, typedAction.groupId);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, MoveMemberToGroupAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* source = findById(roster->groups, typedAction.sourceGroupId);
                                  auto* target = findById(roster->groups, typedAction.targetGroupId);
                                  if (source == nullptr || target == nullptr)
                                      return juce::Result::fail("Move source or target group not found");
                                  if (!isGroupUserEditable(source->origin) || !isGroupUserEditable(target->origin))
                                      return juce::Result::fail("Members can only move between local groups");
                                  if (!memberExists(*roster, typedAction.memberId))
                                      return juce::Result::fail("Member not found: " + typedAction.memberId);

                                  eraseValue(source->memberIds, typedAction.memberId);
                                  appendUnique(target->memberIds, typedAction.memberId);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CopyMemberToGroupAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* target = findById(roster->groups, typedAction.targetGroupId);
                                  if (target == nullptr)
                                      return juce::Result::fail("Copy target group not found");
                                  if (!isGroupUserEditable(target->origin))
                                      return juce::Result::fail("Members can only be copied into local groups");
                                  if (!memberExists(*roster, typedAction.memberId))
                                      return juce::Result::fail("Member not found: " + typedAction.memberId);

                                  appendUnique(target->memberIds, typedAction.memberId);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CreateGroupSetWithMemberAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  const auto* member = findMember(*roster, typedAction.memberId);
                                  if (member == nullptr)
                                      return juce::Result::fail("Member not found: " + typedAction.memberId);
                                  if (findById(roster->groups, typedAction.groupId) != nullptr
                                      || findById(roster->groupSets, typedAction.groupSetId) != nullptr)
                                      return juce::Result::fail("Group or group set id already exists");

                                  Group group;
                                  group.id = typedAction.groupId;
                                  group.name = member->name;
                                  group.memberIds = { typedAction.memberId };
                                  group.origin = GroupOrigin::local;

                                  GroupSet groupSet;
                                  groupSet.id = typedAction.groupSetId;
                                  groupSet.name = typedAction.groupSetName.isNotEmpty() ? typedAction.groupSetName
                                                                                        : nextNewGroupSetName(roster);
                                  groupSet.groupIds = { group.id };
                                  groupSet.connection = LocalConnection {};

                                  roster->groups.push_back(std::move(group));
                                  roster->groupSets.push_back(std::move(groupSet));

                                  detachFromMoveSource(*roster, typedAction.memberId, typedAction.transfer, typedAction.sourceGroupId);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CreateGroupInSetWithMemberAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  const auto* member = findMember(*roster, typedAction.memberId);
                                  if (member == nullptr)
                                      return juce::Result::fail("Member not found: " + typedAction.memberId);

                                  auto* groupSet = findById(roster->groupSets, typedAction.groupSetId);
                                  if (groupSet == nullptr)
                                      return juce::Result::fail("Group set not found: " + typedAction.groupSetId);
                                  if (!acceptsLocalGroups(groupSet->connection))
                                      return juce::Result::fail("Group set does not accept local groups");
                                  if (findById(roster->groups, typedAction.groupId) != nullptr)
                                      return juce::Result::fail("Group id already exists: " + typedAction.groupId);

                                  Group group;
                                  group.id = typedAction.groupId;
                                  group.name = member->name;
                                  group.memberIds = { typedAction.memberId };
                                  group.origin = GroupOrigin::local;

                                  groupSet->groupIds.push_back(group.id);
                                  roster->groups.push_back(std::move(group));

                                  detachFromMoveSource(*roster, typedAction.memberId, typedAction.transfer, typedAction.sourceGroupId);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CreateLocalGroupSetAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  if (findById(roster->groupSets, typedAction.groupSetId) != nullptr)
                                      return juce::Result::fail("Group set id already exists: " + typedAction.groupSetId);

                                  GroupSet groupSet;
                                  groupSet.id = typedAction.groupSetId;
                                  groupSet.name = typedAction.name.trim();
                                  groupSet.connection = LocalConnection {};
                                  for (const auto& groupId : typedAction.groupIds)
                                  {
                                      if (findById(roster->groups, groupId) != nullptr)
                                          appendUnique(groupSet.groupIds, groupId);
                                  }

                                  roster->groupSets.push_back(std::move(groupSet));
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CopyGroupSetAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  const auto* source = findById(roster->groupSets, typedAction.sourceId);
                                  if (source == nullptr)
                                      return juce::Result::fail("Group set not found: " + typedAction.sourceId);
                                  if (findById(roster->groupSets, typedAction.copyId) != nullptr)
                                      return juce::Result::fail("Group set id already exists: " + typedAction.copyId);

                                  GroupSet copy;
                                  copy.id = typedAction.copyId;
                                  copy.name = source->name + " (copy)";
                                  copy.groupIds = source->groupIds;
                                  copy.connection = LocalConnection {};

                                  roster->groupSets.push_back(std::move(copy));
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, RenameGroupSetAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  auto* groupSet = findById(roster->groupSets, typedAction.id);
                                  if (groupSet == nullptr)
                                      return juce::Result::fail("Group set not found: " + typedAction.id);
                                  if (!isGroupSetUserEditable(groupSet->connection))
                                      return juce::Result::fail("System group sets cannot be renamed");

                                  groupSet->name = typedAction.name.trim();
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, DeleteGroupSetAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  return Integrity::removeGroupSet(*roster, typedAction.id);
                              }

                              else if constexpr (std::is_same_v<T, SetRosterAction>)
                              {
                                  if (!document.has_value())
                                      return juce::Result::fail("No document loaded");

                                  document->roster = typedAction.roster;
                                  Integrity::sweepOrphanedGroups(*document->roster);
                                  return juce::Result::ok();
                              }

                              else if constexpr (std::is_same_v<T, CleanupOrphanedGroupsAction>)
                              {
                                  Roster* roster = nullptr;
                                  const auto rosterCheck = requireRoster(document, roster);
                                  if (rosterCheck.failed())
                                      return rosterCheck;

                                  Integrity::sweepOrphanedGroups(*roster);
                                  return juce::Result::ok();
                              }

                              else
                              {
                                  if (!document.has_value())
                                      return juce::Result::fail("No document loaded");

                                  auto& settings = document->settings;

                                  if constexpr (std::is_same_v<T, SetCourseAction>)
                                      settings.course = typedAction.course;
                                  else if constexpr (std::is_same_v<T, SetCourseVerifiedAtAction>)
                                      settings.courseVerifiedAt = typedAction.timestamp;
                                  else if constexpr (std::is_same_v<T, SetGitConnectionAction>)
                                  {
                                      settings.gitConnection = typedAction.name;
                                      document->resolvedIdentityMode = typedAction.resolvedIdentityMode;
                                  }
                                  else if constexpr (std::is_same_v<T, SetOperationsAction>)
                                      settings.operations = typedAction.operations;
                                  else if constexpr (std::is_same_v<T, SetExportsAction>)
                                      settings.exports = typedAction.exports;
                                  else
                                      static_assert(kAlwaysFalse<T>, "unhandled document action");

                                  return juce::Result::ok();
                              }
                          },
                          action);
    }
}
