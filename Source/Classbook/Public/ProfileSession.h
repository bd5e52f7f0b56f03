#pragma once

#include "Classbook/Public/Action.h"
#include "Classbook/Public/CommandGateway.h"
#include "Classbook/Public/Patch.h"
#include "Classbook/Public/Selectors.h"
#include "Classbook/Public/Services.h"
#include "Classbook/Public/Types.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace Classbook
{
    enum class SessionStatus
    {
        empty,
        loading,
        loaded,
        error
    };

    struct SessionOptions
    {
        size_t historyLimit = 100;
        int validationDebounceMs = 200;
        bool ensureSystemSetsOnLoad = true;
    };

    struct ProfileLoadResult
    {
        bool ok = false;
        juce::StringArray warnings;
        std::optional<juce::String> error;
        juce::String profileName;
        bool stale = false;
    };

    // -----------------------------------------------------------------------------
    //  ProfileSession
    //
    //  The editing session for one profile at a time. Owns the document store,
    //  the validation scheduler and the assignment selection. All calls must be
    //  made on the message thread; gateway callbacks are expected there too.
    //
    //  Mutations return false (or no id) when the action was refused or changed
    //  nothing. Neither case records history or schedules validation.
    // -----------------------------------------------------------------------------

    class ProfileSession
    {
    public:
        using DocumentPtr = std::shared_ptr<const ProfileDocument>;
        using LoadCallback = std::function<void(const ProfileLoadResult&)>;
        using SaveCallback = std::function<void(bool)>;

        ProfileSession(CommandGateway& gateway,
                       IdentifierService& identifiers,
                       const AppSettingsLookup& appSettings,
                       SessionOptions options = {});
        ~ProfileSession();

        ProfileSession(const ProfileSession&) = delete;
        ProfileSession& operator=(const ProfileSession&) = delete;

        // Lifecycle
        void load(const juce::String& profileName, LoadCallback onComplete = {});
        void save(const juce::String& profileName, SaveCallback onComplete = {});
        void setDocument(ProfileDocument document);
        void clear();

        DocumentPtr document() const noexcept;
        SessionStatus getStatus() const noexcept;
        const std::optional<juce::String>& getError() const noexcept;
        const juce::StringArray& getWarnings() const noexcept;
        bool areSystemSetsReady() const noexcept;

        // Members
        bool addMember(const RosterMember& member);
        bool updateMember(const RosterMemberId& id, const RosterMemberUpdate& update);
        bool removeMember(const RosterMemberId& id);

        // Assignments
        std::optional<AssignmentId> createAssignment(const AssignmentDraft& draft, bool select = false);
        bool addAssignment(const Assignment& assignment, bool select = false);
        bool updateAssignment(const AssignmentId& id, const AssignmentUpdate& update);
        bool deleteAssignment(const AssignmentId& id);

        // Groups
        std::optional<GroupId> createGroup(const GroupSetId& groupSetId,
                                           const juce::String& name,
                                           const std::vector<RosterMemberId>& memberIds);
        bool updateGroup(const GroupId& id, const GroupUpdate& update);
        bool deleteGroup(const GroupId& id);
        bool addGroupToSet(const GroupSetId& groupSetId, const GroupId& groupId);
        bool removeGroupFromSet(const GroupSetId& groupSetId, const GroupId& groupId);
        bool moveMemberToGroup(const RosterMemberId& memberId, const GroupId& sourceGroupId, const GroupId& targetGroupId);
        bool copyMemberToGroup(const RosterMemberId& memberId, const GroupId& targetGroupId);
        std::optional<GroupSetId> createGroupSetWithMember(const RosterMemberId& memberId,
                                                           const std::optional<GroupId>& sourceGroupId,
                                                           MemberTransfer transfer);
        std::optional<GroupId> createGroupInSetWithMember(const RosterMemberId& memberId,
                                                          const GroupSetId& groupSetId,
                                                          const std::optional<GroupId>& sourceGroupId,
                                                          MemberTransfer transfer);

        // Group sets
        std::optional<GroupSetId> createLocalGroupSet(const juce::String& name, const std::vector<GroupId>& groupIds = {});
        std::optional<GroupSetId> copyGroupSet(const GroupSetId& id);
        bool renameGroupSet(const GroupSetId& id, const juce::String& name);
        bool deleteGroupSet(const GroupSetId& id);

        // Whole roster
        bool setRoster(Roster roster, const juce::String& description = "Update roster");
        bool cleanupOrphanedGroups();
        void ensureSystemGroupSets();

        // Settings
        bool setCourse(const CourseInfo& course);
        bool setCourseVerifiedAt(const std::optional<juce::String>& timestamp);
        bool setGitConnection(const std::optional<juce::String>& name);
        bool setOperations(const OperationConfigs& operations);
        bool setExports(const ExportSettings& exports);
        // Re-resolves the identity mode after app-level git connections changed.
        void updateResolvedIdentityMode();

        // Selection (not undoable)
        const std::optional<AssignmentId>& getAssignmentSelection() const noexcept;
        bool setAssignmentSelection(const std::optional<AssignmentId>& assignmentId);

        // Validation
        const std::optional<ValidationResult>& getRosterValidation() const noexcept;
        const std::map<AssignmentId, ValidationResult>& getAssignmentValidations() const noexcept;
        const ValidationResult* getSelectedAssignmentValidation() const noexcept;
        void flushPendingValidation();
        bool hasPendingValidation() const noexcept;

        // History. Undo and redo re-run the system set synchronizer.
        std::optional<HistoryEntry> undo();
        std::optional<HistoryEntry> redo();
        bool canUndo() const noexcept;
        bool canRedo() const noexcept;
        size_t undoDepth() const noexcept;
        size_t redoDepth() const noexcept;
        std::optional<juce::String> nextUndoDescription() const;
        std::optional<juce::String> nextRedoDescription() const;
        void clearHistory();

        // Memoized views over the current document.
        Selectors::RosterViews& views();

        void setStateChangedCallback(std::function<void()> callback);

    private:
        class Impl;
        std::unique_ptr<Impl> impl;
    };
}
