#pragma once

#include "Classbook/Public/Types.h"
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace Classbook
{
    // -----------------------------------------------------------------------------
    //  Document Actions
    //
    //  Rules:
    //  - Every action is an undo/redo candidate and is applied by Core::Reducer
    //    against a draft copy of the current document.
    //  - Actions are payload-only. Ids for new entities and the resolved git
    //    identity mode are filled in by the session before dispatch, so the
    //    reducer stays deterministic.
    //  - Assignment selection is session state and never travels in an action.
    // -----------------------------------------------------------------------------

    enum class MemberTransfer
    {
        move,
        copy
    };

    struct RosterMemberUpdate
    {
        std::optional<juce::String> name;
        std::optional<juce::String> email;
        std::optional<std::optional<juce::String>> studentNumber;
        std::optional<std::optional<juce::String>> gitUsername;
        std::optional<GitUsernameStatus> gitUsernameStatus;
        std::optional<MemberStatus> status;
        std::optional<std::optional<juce::String>> lmsUserId;
        std::optional<EnrollmentType> enrollmentType;
        std::optional<std::optional<juce::String>> enrollmentDisplay;
        std::optional<juce::String> source;
    };

    struct AssignmentUpdate
    {
        std::optional<juce::String> name;
        std::optional<std::optional<juce::String>> description;
        std::optional<AssignmentType> assignmentType;
        std::optional<GroupSetId> groupSetId;
        std::optional<GroupSelectionMode> groupSelection;
    };

    struct GroupUpdate
    {
        std::optional<juce::String> name;
        std::optional<std::vector<RosterMemberId>> memberIds;
    };

    // Assignment fields without an id; createAssignment allocates one.
    struct AssignmentDraft
    {
        juce::String name;
        std::optional<juce::String> description;
        AssignmentType assignmentType = AssignmentType::classWide;
        GroupSetId groupSetId;
        GroupSelectionMode groupSelection;
    };

    struct AddMemberAction
    {
        RosterMember member;
    };

    struct UpdateMemberAction
    {
        RosterMemberId id;
        RosterMemberUpdate update;
    };

    struct RemoveMemberAction
    {
        RosterMemberId id;
    };

    struct AddAssignmentAction
    {
        Assignment assignment;
    };

    struct UpdateAssignmentAction
    {
        AssignmentId id;
        AssignmentUpdate update;
    };

    struct DeleteAssignmentAction
    {
        AssignmentId id;
    };

    struct CreateGroupAction
    {
        GroupSetId groupSetId;
        GroupId groupId;
        juce::String name;
        std::vector<RosterMemberId> memberIds;
    };

    struct UpdateGroupAction
    {
        GroupId id;
        GroupUpdate update;
    };

    struct DeleteGroupAction
    {
        GroupId id;
    };

    struct AddGroupToSetAction
    {
        GroupSetId groupSetId;
        GroupId groupId;
    };

    struct RemoveGroupFromSetAction
    {
        GroupSetId groupSetId;
        GroupId groupId;
    };

    struct MoveMemberToGroupAction
    {
        RosterMemberId memberId;
        GroupId sourceGroupId;
        GroupId targetGroupId;
    };

    struct CopyMemberToGroupAction
    {
        RosterMemberId memberId;
        GroupId targetGroupId;
    };

    struct CreateGroupSetWithMemberAction
    {
        RosterMemberId memberId;
        std::optional<GroupId> sourceGroupId; // only read for MemberTransfer::move
        MemberTransfer transfer = MemberTransfer::move;
        GroupSetId groupSetId;
        GroupId groupId;
        juce::String groupSetName;
    };

    struct CreateGroupInSetWithMemberAction
    {
        RosterMemberId memberId;
        GroupSetId groupSetId;
        std::optional<GroupId> sourceGroupId; // only read for MemberTransfer::move
        MemberTransfer transfer = MemberTransfer::move;
        GroupId groupId;
    };

    struct CreateLocalGroupSetAction
    {
        GroupSetId groupSetId;
        juce::String name;
        std::vector<GroupId> groupIds;
    };

    struct CopyGroupSetAction
    {
        GroupSetId sourceId;
        GroupSetId copyId;
    };

    struct RenameGroupSetAction
    {
        GroupSetId id;
        juce::String name;
    };

    struct DeleteGroupSetAction
    {
        GroupSetId id;
    };

    struct SetRosterAction
    {
        Roster roster;
        juce::String description = "Update roster";
    };

    struct CleanupOrphanedGroupsAction
    {
    };

    struct SetCourseAction
    {
        CourseInfo course;
    };

    struct SetCourseVerifiedAtAction
    {
        std::optional<juce::String> timestamp;
    };

    struct SetGitConnectionAction
    {
        std::optional<juce::String> name;
        GitIdentityMode resolvedIdentityMode = GitIdentityMode::username;
    };

    struct SetOperationsAction
    {
        OperationConfigs operations;
    };

    struct SetExportsAction
    {
        ExportSettings exports;
    };

    using Action = std::variant<
        AddMemberAction,
        UpdateMemberAction,
        RemoveMemberAction,
        AddAssignmentAction,
        UpdateAssignmentAction,
        DeleteAssignmentAction,
        CreateGroupAction,
        UpdateGroupAction,
        DeleteGroupAction,
        AddGroupToSetAction,
        RemoveGroupFromSetAction,
        MoveMemberToGroupAction,
        CopyMemberToGroupAction,
        CreateGroupSetWithMemberAction,
        CreateGroupInSetWithMemberAction,
        CreateLocalGroupSetAction,
        CopyGroupSetAction,
        RenameGroupSetAction,
        DeleteGroupSetAction,
        SetRosterAction,
        CleanupOrphanedGroupsAction,
        SetCourseAction,
        SetCourseVerifiedAtAction,
        SetGitConnectionAction,
        SetOperationsAction,
        SetExportsAction>;

    static_assert(std::variant_size_v<Action> == 26,
                  "Action variant must contain exactly twenty-six document actions");

    // Settings-only actions do not touch the roster and never need a roster present.
    inline bool isSettingsAction(const Action& action) noexcept
    {
        return std::holds_alternative<SetCourseAction>(action)
            || std::holds_alternative<SetCourseVerifiedAtAction>(action)
            || std::holds_alternative<SetGitConnectionAction>(action)
            || std::holds_alternative<SetOperationsAction>(action)
            || std::holds_alternative<SetExportsAction>(action);
    }

    inline juce::Result validateAction(const Action& action)
    {
        return std::visit([](const auto& typedAction) -> juce::Result
                          {
                              using T = std::decay_t<decltype(typedAction)>;

                              if constexpr (std::is_same_v<T, AddMemberAction>)
                              {
                                  if (typedAction.member.id.isEmpty())
                                      return juce::Result::fail("AddMember requires a member id");
                              }
                              else if constexpr (std::is_same_v<T, AddAssignmentAction>)
                              {
                                  if (typedAction.assignment.id.isEmpty())
                                      return juce::Result::fail("AddAssignment requires an assignment id");
                              }
                              else if constexpr (std::is_same_v<T, CreateGroupAction>)
                              {
                                  if (typedAction.groupId.isEmpty())
                                      return juce::Result::fail("CreateGroup requires a group id");
                              }
                              else if constexpr (std::is_same_v<T, CreateGroupSetWithMemberAction>)
                              {
                                  if (typedAction.groupSetId.isEmpty() || typedAction.groupId.isEmpty())
                                      return juce::Result::fail("CreateGroupSetWithMember requires set and group ids");
                              }
                              else if constexpr (std::is_same_v<T, CreateGroupInSetWithMemberAction>)
                              {
                                  if (typedAction.groupId.isEmpty())
                                      return juce::Result::fail("CreateGroupInSetWithMember requires a group id");
                              }
                              else if constexpr (std::is_same_v<T, CreateLocalGroupSetAction>)
                              {
                                  if (typedAction.groupSetId.isEmpty())
                                      return juce::Result::fail("CreateLocalGroupSet requires a group set id");
                                  if (typedAction.name.trim().isEmpty())
                                      return juce::Result::fail("Group set name must not be blank");
                              }
                              else if constexpr (std::is_same_v<T, CopyGroupSetAction>)
                              {
                                  if (typedAction.copyId.isEmpty())
                                      return juce::Result::fail("CopyGroupSet requires a copy id");
                              }
                              else if constexpr (std::is_same_v<T, RenameGroupSetAction>)
                              {
                                  if (typedAction.name.trim().isEmpty())
                                      return juce::Result::fail("Group set name must not be blank");
                              }

                              return juce::Result::ok();
                          },
                          action);
    }
}
