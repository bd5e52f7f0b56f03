#pragma once

#include <juce_core/juce_core.h>
#include <algorithm>
#include <map>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace Classbook
{
    using RosterMemberId = juce::String;
    using GroupId = juce::String;
    using GroupSetId = juce::String;
    using AssignmentId = juce::String;

    template <typename>
    inline constexpr bool kAlwaysFalse = false;

    // -----------------------------------------------------------------------------
    //  Settings
    // -----------------------------------------------------------------------------

    enum class GitIdentityMode
    {
        username,
        email
    };

    enum class DirectoryLayout
    {
        flat,
        byTeam,
        byTask
    };

    struct CourseInfo
    {
        juce::String id;
        juce::String name;
    };

    struct CreateConfig
    {
        juce::String templateOrg;
    };

    struct CloneConfig
    {
        juce::String targetDir;
        DirectoryLayout directoryLayout = DirectoryLayout::flat;
    };

    struct DeleteConfig
    {
    };

    struct OperationConfigs
    {
        juce::String targetOrg;
        juce::String repoNameTemplate = "{assignment}-{group}";
        CreateConfig create;
        CloneConfig clone;
        DeleteConfig remove;
    };

    struct ExportSettings
    {
        juce::String outputFolder;
        bool outputCsv = false;
        bool outputXlsx = false;
        bool outputYaml = true;
        juce::String csvFile = "student-info.csv";
        juce::String xlsxFile = "student-info.xlsx";
        juce::String yamlFile = "students.yaml";
        juce::String memberOption = "(email, gitid)";
        bool includeGroup = true;
        bool includeMember = true;
        bool includeInitials = false;
        bool fullGroups = true;
    };

    struct ProfileSettings
    {
        CourseInfo course;
        std::optional<juce::String> courseVerifiedAt;
        std::optional<juce::String> gitConnection;
        OperationConfigs operations;
        ExportSettings exports;
    };

    inline ProfileSettings makeDefaultProfileSettings()
    {
        return {};
    }

    // -----------------------------------------------------------------------------
    //  Roster
    // -----------------------------------------------------------------------------

    enum class GitUsernameStatus
    {
        unknown,
        valid,
        invalid
    };

    enum class MemberStatus
    {
        active,
        dropped,
        incomplete
    };

    enum class EnrollmentType
    {
        student,
        teacher,
        ta,
        designer,
        observer,
        other
    };

    struct RosterMember
    {
        RosterMemberId id;
        juce::String name;
        juce::String email;
        std::optional<juce::String> studentNumber;
        std::optional<juce::String> gitUsername;
        GitUsernameStatus gitUsernameStatus = GitUsernameStatus::unknown;
        MemberStatus status = MemberStatus::active;
        std::optional<juce::String> lmsUserId;
        EnrollmentType enrollmentType = EnrollmentType::student;
        std::optional<juce::String> enrollmentDisplay;
        juce::String source = "local";

        bool isStudent() const noexcept { return enrollmentType == EnrollmentType::student; }
        bool isActive() const noexcept { return status == MemberStatus::active; }
    };

    // Only local groups are user-editable. Other origins are owned by the LMS import
    // and the system set synchronizer.
    enum class GroupOrigin
    {
        local,
        lms,
        system
    };

    struct Group
    {
        GroupId id;
        juce::String name;
        std::vector<RosterMemberId> memberIds;
        GroupOrigin origin = GroupOrigin::local;
        std::optional<juce::String> lmsGroupId;
    };

    enum class SystemSetType
    {
        individualStudents,
        staff
    };

    struct LocalConnection
    {
    };

    struct ImportConnection
    {
        juce::String sourceFilename;
        juce::String lastUpdated;
    };

    struct CanvasConnection
    {
        juce::String courseId;
        juce::String groupSetId;
        juce::String lastUpdated;
    };

    struct MoodleConnection
    {
        juce::String courseId;
        juce::String groupingId;
        juce::String lastUpdated;
    };

    struct SystemConnection
    {
        SystemSetType systemType = SystemSetType::individualStudents;
    };

    using GroupSetConnection = std::variant<LocalConnection,
                                            ImportConnection,
                                            CanvasConnection,
                                            MoodleConnection,
                                            SystemConnection>;

    struct GroupSet
    {
        GroupSetId id;
        juce::String name;
        std::vector<GroupId> groupIds;
        GroupSetConnection connection;
    };

    enum class AssignmentType
    {
        classWide,
        selective
    };

    struct GroupSelectionMode
    {
        enum class Kind
        {
            all,
            pattern
        };

        Kind kind = Kind::all;
        juce::String pattern;
        std::vector<GroupId> excludedGroupIds;
    };

    struct Assignment
    {
        AssignmentId id;
        juce::String name;
        std::optional<juce::String> description;
        AssignmentType assignmentType = AssignmentType::classWide;
        GroupSetId groupSetId;
        GroupSelectionMode groupSelection;
    };

    struct RosterConnection
    {
        enum class Kind
        {
            canvas,
            moodle,
            import
        };

        Kind kind = Kind::import;
        juce::String courseId;
        juce::String sourceFilename;
        juce::String lastUpdated;
    };

    struct Roster
    {
        std::optional<RosterConnection> connection;
        std::vector<RosterMember> students;
        std::vector<RosterMember> staff;
        std::vector<Group> groups;
        std::vector<GroupSet> groupSets;
        std::vector<Assignment> assignments;
    };

    struct ProfileDocument
    {
        ProfileSettings settings;
        std::optional<Roster> roster;
        GitIdentityMode resolvedIdentityMode = GitIdentityMode::username;
    };

    // -----------------------------------------------------------------------------
    //  Validation / system sets (gateway payloads)
    // -----------------------------------------------------------------------------

    enum class ValidationKind
    {
        systemGroupSetsMissing,
        duplicateStudentId,
        missingEmail,
        invalidEmail,
        duplicateEmail,
        duplicateAssignmentName,
        duplicateGroupIdInAssignment,
        duplicateGroupNameInAssignment,
        orphanGroupMember,
        missingGroupSet,
        emptyGroup,
        studentInMultipleGroupsInAssignment,
        studentMissingFromAssignment,
        missingGitUsername,
        invalidGitUsername,
        invalidEnrollmentPartition,
        invalidGroupOrigin
    };

    struct ValidationIssue
    {
        ValidationKind kind = ValidationKind::orphanGroupMember;
        std::vector<juce::String> affectedIds;
        std::optional<juce::String> context;
    };

    struct ValidationResult
    {
        std::vector<ValidationIssue> issues;

        bool isClean() const noexcept { return issues.empty(); }
    };

    struct SystemGroupSetPatch
    {
        std::vector<GroupSet> groupSets;
        std::vector<Group> groupsUpserted;
        std::vector<GroupId> deletedGroupIds;
    };

    // -----------------------------------------------------------------------------
    //  Connection helpers
    // -----------------------------------------------------------------------------

    inline bool isSystemConnection(const GroupSetConnection& connection) noexcept
    {
        return std::holds_alternative<SystemConnection>(connection);
    }

    inline std::optional<SystemSetType> systemTypeOf(const GroupSet& groupSet) noexcept
    {
        if (const auto* system = std::get_if<SystemConnection>(&groupSet.connection))
            return system->systemType;

        return std::nullopt;
    }

    inline bool isLmsConnection(const GroupSetConnection& connection) noexcept
    {
        return std::visit([](const auto& typed) -> bool
                          {
                              using T = std::decay_t<decltype(typed)>;
                              if constexpr (std::is_same_v<T, LocalConnection>)
                                  return false;
                              else if constexpr (std::is_same_v<T, ImportConnection>)
                                  return false;
                              else if constexpr (std::is_same_v<T, CanvasConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, MoodleConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, SystemConnection>)
                                  return false;
                              else
                                  static_assert(kAlwaysFalse<T>, "unhandled group set connection");
                          },
                          connection);
    }

    // User edits (rename, delete) are refused for system sets only. LMS-linked sets can be
    // renamed and deleted locally; their groups stay read-only through GroupOrigin.
    inline bool isGroupSetUserEditable(const GroupSetConnection& connection) noexcept
    {
        return std::visit([](const auto& typed) -> bool
                          {
                              using T = std::decay_t<decltype(typed)>;
                              if constexpr (std::is_same_v<T, LocalConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, ImportConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, CanvasConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, MoodleConnection>)
                                  return true;
                              else if constexpr (std::is_same_v<T, SystemConnection>)
                                  return false;
                              else
                                  static_assert(kAlwaysFalse<T>, "unhandled group set connection");
                          },
                          connection);
    }

    inline bool isGroupUserEditable(GroupOrigin origin) noexcept
    {
        switch (origin)
        {
            case GroupOrigin::local: return true;
            case GroupOrigin::lms: return false;
            case GroupOrigin::system: return false;
        }

        return false;
    }

    // -----------------------------------------------------------------------------
    //  Enum keys (wire names shared by the JSON codec and the gateway)
    // -----------------------------------------------------------------------------

    inline juce::String gitIdentityModeToKey(GitIdentityMode mode)
    {
        switch (mode)
        {
            case GitIdentityMode::username: return "username";
            case GitIdentityMode::email: return "email";
        }

        return "username";
    }

    inline std::optional<GitIdentityMode> gitIdentityModeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "username") return GitIdentityMode::username;
        if (normalized == "email") return GitIdentityMode::email;
        return std::nullopt;
    }

    inline juce::String directoryLayoutToKey(DirectoryLayout layout)
    {
        switch (layout)
        {
            case DirectoryLayout::flat: return "flat";
            case DirectoryLayout::byTeam: return "by-team";
            case DirectoryLayout::byTask: return "by-task";
        }

        return "flat";
    }

    inline std::optional<DirectoryLayout> directoryLayoutFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "flat") return DirectoryLayout::flat;
        if (normalized == "by-team") return DirectoryLayout::byTeam;
        if (normalized == "by-task") return DirectoryLayout::byTask;
        return std::nullopt;
    }

    inline juce::String gitUsernameStatusToKey(GitUsernameStatus status)
    {
        switch (status)
        {
            case GitUsernameStatus::unknown: return "unknown";
            case GitUsernameStatus::valid: return "valid";
            case GitUsernameStatus::invalid: return "invalid";
        }

        return "unknown";
    }

    inline std::optional<GitUsernameStatus> gitUsernameStatusFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "unknown") return GitUsernameStatus::unknown;
        if (normalized == "valid") return GitUsernameStatus::valid;
        if (normalized == "invalid") return GitUsernameStatus::invalid;
        return std::nullopt;
    }

    inline juce::String memberStatusToKey(MemberStatus status)
    {
        switch (status)
        {
            case MemberStatus::active: return "active";
            case MemberStatus::dropped: return "dropped";
            case MemberStatus::incomplete: return "incomplete";
        }

        return "active";
    }

    inline std::optional<MemberStatus> memberStatusFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "active") return MemberStatus::active;
        if (normalized == "dropped") return MemberStatus::dropped;
        if (normalized == "incomplete") return MemberStatus::incomplete;
        return std::nullopt;
    }

    inline juce::String enrollmentTypeToKey(EnrollmentType type)
    {
        switch (type)
        {
            case EnrollmentType::student: return "student";
            case EnrollmentType::teacher: return "teacher";
            case EnrollmentType::ta: return "ta";
            case EnrollmentType::designer: return "designer";
            case EnrollmentType::observer: return "observer";
            case EnrollmentType::other: return "other";
        }

        return "other";
    }

    inline std::optional<EnrollmentType> enrollmentTypeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "student") return EnrollmentType::student;
        if (normalized == "teacher") return EnrollmentType::teacher;
        if (normalized == "ta") return EnrollmentType::ta;
        if (normalized == "designer") return EnrollmentType::designer;
        if (normalized == "observer") return EnrollmentType::observer;
        if (normalized == "other") return EnrollmentType::other;
        return std::nullopt;
    }

    inline juce::String groupOriginToKey(GroupOrigin origin)
    {
        switch (origin)
        {
            case GroupOrigin::local: return "local";
            case GroupOrigin::lms: return "lms";
            case GroupOrigin::system: return "system";
        }

        return "local";
    }

    inline std::optional<GroupOrigin> groupOriginFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "local") return GroupOrigin::local;
        if (normalized == "lms") return GroupOrigin::lms;
        if (normalized == "system") return GroupOrigin::system;
        return std::nullopt;
    }

    inline juce::String systemSetTypeToKey(SystemSetType type)
    {
        switch (type)
        {
            case SystemSetType::individualStudents: return "individual_students";
            case SystemSetType::staff: return "staff";
        }

        return "individual_students";
    }

    inline std::optional<SystemSetType> systemSetTypeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "individual_students") return SystemSetType::individualStudents;
        if (normalized == "staff") return SystemSetType::staff;
        return std::nullopt;
    }

    inline juce::String assignmentTypeToKey(AssignmentType type)
    {
        switch (type)
        {
            case AssignmentType::classWide: return "class_wide";
            case AssignmentType::selective: return "selective";
        }

        return "class_wide";
    }

    inline std::optional<AssignmentType> assignmentTypeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        if (normalized == "class_wide") return AssignmentType::classWide;
        if (normalized == "selective") return AssignmentType::selective;
        return std::nullopt;
    }

    inline juce::String validationKindToKey(ValidationKind kind)
    {
        switch (kind)
        {
            case ValidationKind::systemGroupSetsMissing: return "system_group_sets_missing";
            case ValidationKind::duplicateStudentId: return "duplicate_student_id";
            case ValidationKind::missingEmail: return "missing_email";
            case ValidationKind::invalidEmail: return "invalid_email";
            case ValidationKind::duplicateEmail: return "duplicate_email";
            case ValidationKind::duplicateAssignmentName: return "duplicate_assignment_name";
            case ValidationKind::duplicateGroupIdInAssignment: return "duplicate_group_id_in_assignment";
            case ValidationKind::duplicateGroupNameInAssignment: return "duplicate_group_name_in_assignment";
            case ValidationKind::orphanGroupMember: return "orphan_group_member";
            case ValidationKind::missingGroupSet: return "missing_group_set";
            case ValidationKind::emptyGroup: return "empty_group";
            case ValidationKind::studentInMultipleGroupsInAssignment: return "student_in_multiple_groups_in_assignment";
            case ValidationKind::studentMissingFromAssignment: return "student_missing_from_assignment";
            case ValidationKind::missingGitUsername: return "missing_git_username";
            case ValidationKind::invalidGitUsername: return "invalid_git_username";
            case ValidationKind::invalidEnrollmentPartition: return "invalid_enrollment_partition";
            case ValidationKind::invalidGroupOrigin: return "invalid_group_origin";
        }

        return "orphan_group_member";
    }

    inline std::optional<ValidationKind> validationKindFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        for (int index = 0; index <= static_cast<int>(ValidationKind::invalidGroupOrigin); ++index)
        {
            const auto kind = static_cast<ValidationKind>(index);
            if (validationKindToKey(kind) == normalized)
                return kind;
        }

        return std::nullopt;
    }

    // Blocking issues stop repository operations; the rest are shown as warnings.
    inline bool isBlockingValidation(ValidationKind kind) noexcept
    {
        switch (kind)
        {
            case ValidationKind::missingEmail:
            case ValidationKind::missingGitUsername:
            case ValidationKind::invalidGitUsername:
            case ValidationKind::studentMissingFromAssignment:
                return false;
            default:
                return true;
        }
    }

    inline bool hasBlockingIssues(const ValidationResult& result) noexcept
    {
        return std::any_of(result.issues.begin(),
                           result.issues.end(),
                           [](const ValidationIssue& issue)
                           {
                               return isBlockingValidation(issue.kind);
                           });
    }

    // -----------------------------------------------------------------------------
    //  Structural equality (undo/redo round-trips compare whole documents)
    // -----------------------------------------------------------------------------

    inline bool operator==(const CourseInfo& lhs, const CourseInfo& rhs) noexcept
    {
        return lhs.id == rhs.id && lhs.name == rhs.name;
    }

    inline bool operator==(const OperationConfigs& lhs, const OperationConfigs& rhs) noexcept
    {
        return lhs.targetOrg == rhs.targetOrg
            && lhs.repoNameTemplate == rhs.repoNameTemplate
            && lhs.create.templateOrg == rhs.create.templateOrg
            && lhs.clone.targetDir == rhs.clone.targetDir
            && lhs.clone.directoryLayout == rhs.clone.directoryLayout;
    }

    inline bool operator==(const ExportSettings& lhs, const ExportSettings& rhs) noexcept
    {
        return lhs.outputFolder == rhs.outputFolder
            && lhs.outputCsv == rhs.outputCsv
            && lhs.outputXlsx == rhs.outputXlsx
            && lhs.outputYaml == rhs.outputYaml
            && lhs.csvFile == rhs.csvFile
            && lhs.xlsxFile == rhs.xlsxFile
            && lhs.yamlFile == rhs.yamlFile
            && lhs.memberOption == rhs.memberOption
            && lhs.includeGroup == rhs.includeGroup
            && lhs.includeMember == rhs.includeMember
            && lhs.includeInitials == rhs.includeInitials
            && lhs.fullGroups == rhs.fullGroups;
    }

    inline bool operator==(const ProfileSettings& lhs, const ProfileSettings& rhs) noexcept
    {
        return lhs.course == rhs.course
            && lhs.courseVerifiedAt == rhs.courseVerifiedAt
            && lhs.gitConnection == rhs.gitConnection
            && lhs.operations == rhs.operations
            && lhs.exports == rhs.exports;
    }

    inline bool operator==(const RosterMember& lhs, const RosterMember& rhs) noexcept
    {
        return lhs.id == rhs.id
            && lhs.name == rhs.name
            && lhs.email == rhs.email
            && lhs.studentNumber == rhs.studentNumber
            && lhs.gitUsername == rhs.gitUsername
            && lhs.gitUsernameStatus == rhs.gitUsernameStatus
            && lhs.status == rhs.status
            && lhs.lmsUserId == rhs.lmsUserId
            && lhs.enrollmentType == rhs.enrollmentType
            && lhs.enrollmentDisplay == rhs.enrollmentDisplay
            && lhs.source == rhs.source;
    }

    inline bool operator==(const Group& lhs, const Group& rhs) noexcept
    {
        return lhs.id == rhs.id
            && lhs.name == rhs.name
            && lhs.memberIds == rhs.memberIds
            && lhs.origin == rhs.origin
            && lhs.lmsGroupId == rhs.lmsGroupId;
    }

    inline bool operator==(const LocalConnection&, const LocalConnection&) noexcept { return true; }

    inline bool operator==(const ImportConnection& lhs, const ImportConnection& rhs) noexcept
    {
        return lhs.sourceFilename == rhs.sourceFilename && lhs.lastUpdated == rhs.lastUpdated;
    }

    inline bool operator==(const CanvasConnection& lhs, const CanvasConnection& rhs) noexcept
    {
        return lhs.courseId == rhs.courseId && lhs.groupSetId == rhs.groupSetId && lhs.lastUpdated == rhs.lastUpdated;
    }

    inline bool operator==(const MoodleConnection& lhs, const MoodleConnection& rhs) noexcept
    {
        return lhs.courseId == rhs.courseId && lhs.groupingId == rhs.groupingId && lhs.lastUpdated == rhs.lastUpdated;
    }

    inline bool operator==(const SystemConnection& lhs, const SystemConnection& rhs) noexcept
    {
        return lhs.systemType == rhs.systemType;
    }

    inline bool operator==(const GroupSet& lhs, const GroupSet& rhs) noexcept
    {
        return lhs.id == rhs.id
            && lhs.name == rhs.name
            && lhs.groupIds == rhs.groupIds
            && lhs.connection == rhs.connection;
    }

    inline bool operator==(const GroupSelectionMode& lhs, const GroupSelectionMode& rhs) noexcept
    {
        return lhs.kind == rhs.kind && lhs.pattern == rhs.pattern && lhs.excludedGroupIds == rhs.excludedGroupIds;
    }

    inline bool operator==(const Assignment& lhs, const Assignment& rhs) noexcept
    {
        return lhs.id == rhs.id
            && lhs.name == rhs.name
            && lhs.description == rhs.description
            && lhs.assignmentType == rhs.assignmentType
            && lhs.groupSetId == rhs.groupSetId
            && lhs.groupSelection == rhs.groupSelection;
    }

    inline bool operator==(const RosterConnection& lhs, const RosterConnection& rhs) noexcept
    {
        return lhs.kind == rhs.kind
            && lhs.courseId == rhs.courseId
            && lhs.sourceFilename == rhs.sourceFilename
            && lhs.lastUpdated == rhs.lastUpdated;
    }

    inline bool operator==(const Roster& lhs, const Roster& rhs) noexcept
    {
        return lhs.connection == rhs.connection
            && lhs.students == rhs.students
            && lhs.staff == rhs.staff
            && lhs.groups == rhs.groups
            && lhs.groupSets == rhs.groupSets
            && lhs.assignments == rhs.assignments;
    }

    inline bool operator==(const ProfileDocument& lhs, const ProfileDocument& rhs) noexcept
    {
        return lhs.settings == rhs.settings
            && lhs.roster == rhs.roster
            && lhs.resolvedIdentityMode == rhs.resolvedIdentityMode;
    }

    inline bool operator!=(const ProfileDocument& lhs, const ProfileDocument& rhs) noexcept
    {
        return !(lhs == rhs);
    }
}
