#include "Classbook/Public/ProfileSession.h"

#include "Classbook/Core/DocumentStore.h"
#include "Classbook/Core/Integrity.h"
#include "Classbook/Core/SystemGroupSets.h"
#include "Classbook/Session/ValidationScheduler.h"
#include <algorithm>

namespace Classbook
{
    class ProfileSession::Impl
    {
    public:
        Impl(CommandGateway& gatewayToUse,
             IdentifierService& identifiersToUse,
             const AppSettingsLookup& appSettingsToUse,
             SessionOptions optionsToUse)
            : gateway(gatewayToUse),
              identifiers(identifiersToUse),
              appSettings(appSettingsToUse),
              options(optionsToUse),
              store(optionsToUse.historyLimit),
              validation(gatewayToUse,
                         [this] { return store.snapshot(); },
                         optionsToUse.validationDebounceMs)
        {
            validation.onResultsChanged = [this] { notifyStateChanged(); };
        }

        ~Impl()
        {
            validation.onResultsChanged = nullptr;
        }

        // Pending halves of a load; both gateway calls run in parallel.
        struct PendingLoad
        {
            std::optional<juce::Result> settingsResult;
            LoadedProfile profile;
            std::optional<juce::Result> rosterResult;
            Roster roster;
        };

        const Roster* currentRoster() const noexcept
        {
            const auto& document = store.snapshot();
            if (document == nullptr || !document->roster.has_value())
                return nullptr;

            return &(*document->roster);
        }

        bool hasAssignment(const AssignmentId& id) const noexcept
        {
            const auto* roster = currentRoster();
            return roster != nullptr && Selectors::findAssignment(*roster, id) != nullptr;
        }

        bool commit(const Action& action)
        {
            auto outcome = Core::DocumentStore::ApplyOutcome::unchanged;
            const auto result = store.apply(action, &outcome);
            if (result.failed())
            {
                DBG("[Classbook] action ignored: " + result.getErrorMessage());
                return false;
            }

            if (outcome == Core::DocumentStore::ApplyOutcome::unchanged)
                return false;

            if (status == SessionStatus::empty)
                status = SessionStatus::loaded;

            validation.scheduleAll();
            notifyStateChanged();
            return true;
        }

        // A selection that names a vanished assignment falls back to the first one.
        void repairSelection()
        {
            if (assignmentSelection.has_value() && !hasAssignment(*assignmentSelection))
                assignmentSelection = Core::Integrity::defaultAssignmentSelection(currentRoster());
        }

        void installDocument(std::optional<ProfileDocument> document, juce::StringArray newWarnings)
        {
            ++systemSetsSequence;
            store.reset(document.has_value() ? std::make_shared<const ProfileDocument>(std::move(*document)) : nullptr);
            warnings = std::move(newWarnings);
            assignmentSelection = Core::Integrity::defaultAssignmentSelection(currentRoster());
            systemSetsReady = false;
            validation.reset();
        }

        void load(const juce::String& profileName, LoadCallback onComplete)
        {
            status = SessionStatus::loading;
            error.reset();
            warnings.clear();
            notifyStateChanged();

            const auto loadId = ++loadSequence;
            auto pending = std::make_shared<PendingLoad>();
            const juce::WeakReference<Impl> safeThis(this);

            auto finishIfReady = [safeThis, pending, loadId, profileName, onComplete]
            {
                if (!pending->settingsResult.has_value() || !pending->rosterResult.has_value())
                    return;

                if (auto* self = safeThis.get())
                    self->finishLoad(loadId, profileName, *pending, onComplete);
            };

            gateway.loadProfile(profileName,
                                [pending, finishIfReady](juce::Result result, LoadedProfile profile)
                                {
                                    pending->settingsResult = result;
                                    pending->profile = std::move(profile);
                                    finishIfReady();
                                });

            gateway.getRoster(profileName,
                              [pending, finishIfReady](juce::Result result, Roster roster)
                              {
                                  pending->rosterResult = result;
                                  pending->roster = std::move(roster);
                                  finishIfReady();
                              });
        }

        void finishLoad(uint64_t loadId,
                        const juce::String& profileName,
                        PendingLoad& pending,
                        const LoadCallback& onComplete)
        {
            ProfileLoadResult outcome;
            outcome.profileName = profileName;

            if (loadId != loadSequence)
            {
                DBG("[Classbook][Load] discarding stale load of '" + profileName + "'");
                outcome.stale = true;
                if (onComplete != nullptr)
                    onComplete(outcome);
                return;
            }

            const auto& settingsResult = *pending.settingsResult;
            const auto& rosterResult = *pending.rosterResult;

            std::optional<Roster> roster;
            if (rosterResult.wasOk())
                roster = std::move(pending.roster);

            if (settingsResult.failed())
            {
                const auto message = "settings: " + settingsResult.getErrorMessage();

                ProfileSettings defaults;
                const auto defaultsResult = gateway.getDefaultSettings(defaults);
                if (defaultsResult.failed())
                {
                    DBG("[Classbook][Load] default settings unavailable: " + defaultsResult.getErrorMessage());
                }
                else
                {
                    ProfileDocument fallback;
                    fallback.resolvedIdentityMode = appSettings.resolveIdentityMode(defaults.gitConnection);
                    fallback.settings = std::move(defaults);
                    fallback.roster = roster;
                    installDocument(std::move(fallback), {});
                    DBG("[Classbook][Load] failed to load profile '" + profileName + "': " + message
                        + ". Loaded default settings.");
                }

                status = SessionStatus::error;
                error = message;
                outcome.error = message;
                afterDocumentInstalled(defaultsResult.wasOk() && roster.has_value());
                if (onComplete != nullptr)
                    onComplete(outcome);
                return;
            }

            auto& profile = pending.profile;
            for (const auto& warning : profile.warnings)
            {
                DBG("[Classbook][Load] " + warning);
                juce::ignoreUnused(warning);
            }

            ProfileDocument document;
            document.resolvedIdentityMode = appSettings.resolveIdentityMode(profile.settings.gitConnection);
            document.settings = profile.settings;
            document.roster = roster;
            installDocument(std::move(document), profile.warnings);
            outcome.warnings = profile.warnings;

            if (rosterResult.failed())
            {
                const auto message = "roster: " + rosterResult.getErrorMessage();
                DBG("[Classbook][Load] failed to load roster for profile '" + profileName + "': " + message
                    + ". Loaded profile settings without roster.");

                status = SessionStatus::error;
                error = message;
                outcome.error = message;
                afterDocumentInstalled(false);
                if (onComplete != nullptr)
                    onComplete(outcome);
                return;
            }

            status = SessionStatus::loaded;
            error.reset();
            outcome.ok = true;
            afterDocumentInstalled(true);
            if (onComplete != nullptr)
                onComplete(outcome);
        }

        void afterDocumentInstalled(bool hasRoster)
        {
            if (hasRoster)
            {
                validation.scheduleAll();
                if (options.ensureSystemSetsOnLoad)
                    ensureSystemGroupSets();
            }

            notifyStateChanged();
        }

        void save(const juce::String& profileName, SaveCallback onComplete)
        {
            const auto current = store.snapshot();
            if (current == nullptr)
            {
                if (onComplete != nullptr)
                    onComplete(false);
                return;
            }

            validation.flushPending();
            status = SessionStatus::loading;
            error.reset();
            notifyStateChanged();

            const auto loadIdAtSave = loadSequence;
            const juce::WeakReference<Impl> safeThis(this);

            gateway.saveProfileAndRoster(profileName,
                                         current->settings,
                                         current->roster,
                                         [safeThis, loadIdAtSave, onComplete](juce::Result result)
                                         {
                                             auto* self = safeThis.get();
                                             if (self == nullptr)
                                                 return;

                                             if (loadIdAtSave != self->loadSequence)
                                             {
                                                 DBG("[Classbook] save finished after another profile was loaded, ignoring");
                                                 if (onComplete != nullptr)
                                                     onComplete(false);
                                                 return;
                                             }

                                             if (result.failed())
                                             {
                                                 self->status = SessionStatus::error;
                                                 self->error = result.getErrorMessage();
                                                 self->notifyStateChanged();
                                                 if (onComplete != nullptr)
                                                     onComplete(false);
                                                 return;
                                             }

                                             self->status = SessionStatus::loaded;
                                             self->error.reset();
                                             self->store.clearHistory();
                                             self->notifyStateChanged();
                                             if (onComplete != nullptr)
                                                 onComplete(true);
                                         });
        }

        void setDocument(ProfileDocument document)
        {
            installDocument(std::move(document), {});
            status = SessionStatus::loaded;
            error.reset();
            notifyStateChanged();
        }

        void clear()
        {
            ++loadSequence;
            installDocument(std::nullopt, {});
            assignmentSelection.reset();
            status = SessionStatus::empty;
            error.reset();
            notifyStateChanged();
        }

        void ensureSystemGroupSets()
        {
            // Held so the roster outlives an inline callback that replaces the snapshot.
            const auto document = store.snapshot();
            if (document == nullptr || !document->roster.has_value())
                return;

            const auto sequence = ++systemSetsSequence;
            const juce::WeakReference<Impl> safeThis(this);

            gateway.ensureSystemGroupSets(*document->roster,
                                          [safeThis, sequence](juce::Result result, SystemGroupSetPatch patch)
                                          {
                                              auto* self = safeThis.get();
                                              if (self == nullptr || sequence != self->systemSetsSequence)
                                                  return;

                                              if (result.failed())
                                              {
                                                  DBG("[Classbook][SystemSets] failed to ensure system group sets: "
                                                      + result.getErrorMessage());
                                                  return;
                                              }

                                              self->applySystemGroupSetPatch(patch);
                                          });
        }

        void applySystemGroupSetPatch(const SystemGroupSetPatch& patch)
        {
            const auto current = store.snapshot();
            if (current == nullptr || !current->roster.has_value())
                return;

            auto next = std::make_shared<ProfileDocument>(*current);
            Core::SystemGroupSets::mergePatch(*next->roster, patch);

            if (*next != *current)
            {
                store.replaceWithoutHistory(std::move(next));
                validation.scheduleAll();
            }

            systemSetsReady = true;
            notifyStateChanged();
        }

        void updateResolvedIdentityMode()
        {
            const auto current = store.snapshot();
            if (current == nullptr)
                return;

            const auto mode = appSettings.resolveIdentityMode(current->settings.gitConnection);
            if (mode == current->resolvedIdentityMode)
                return;

            auto next = std::make_shared<ProfileDocument>(*current);
            next->resolvedIdentityMode = mode;
            store.replaceWithoutHistory(std::move(next));
            validation.scheduleAssignmentValidation();
            notifyStateChanged();
        }

        void notifyStateChanged()
        {
            if (stateChanged != nullptr)
                stateChanged();
        }

        CommandGateway& gateway;
        IdentifierService& identifiers;
        const AppSettingsLookup& appSettings;
        SessionOptions options;

        Core::DocumentStore store;
        Session::ValidationScheduler validation;
        Selectors::RosterViews rosterViews;

        SessionStatus status = SessionStatus::empty;
        std::optional<juce::String> error;
        juce::StringArray warnings;
        std::optional<AssignmentId> assignmentSelection;
        bool systemSetsReady = false;

        uint64_t loadSequence = 0;
        uint64_t systemSetsSequence = 0;

        std::function<void()> stateChanged;

        JUCE_DECLARE_WEAK_REFERENCEABLE (Impl)
    };

    ProfileSession::ProfileSession(CommandGateway& gateway,
                                   IdentifierService& identifiers,
                                   const AppSettingsLookup& appSettings,
                                   SessionOptions options)
        : impl(std::make_unique<Impl>(gateway, identifiers, appSettings, options))
    {
    }

    ProfileSession::~ProfileSession() = default;

    void ProfileSession::load(const juce::String& profileName, LoadCallback onComplete)
    {
        impl->load(profileName, std::move(onComplete));
    }

    void ProfileSession::save(const juce::String& profileName, SaveCallback onComplete)
    {
        impl->save(profileName, std::move(onComplete));
    }

    void ProfileSession::setDocument(ProfileDocument document)
    {
        impl->setDocument(std::move(document));
    }

    void ProfileSession::clear()
    {
        impl->clear();
    }

    ProfileSession::DocumentPtr ProfileSession::document() const noexcept
    {
        return impl->store.snapshot();
    }

    SessionStatus ProfileSession::getStatus() const noexcept
    {
        return impl->status;
    }

    const std::optional<juce::String>& ProfileSession::getError() const noexcept
    {
        return impl->error;
    }

    const juce::StringArray& ProfileSession::getWarnings() const noexcept
    {
        return impl->warnings;
    }

    bool ProfileSession::areSystemSetsReady() const noexcept
    {
        return impl->systemSetsReady;
    }

    bool ProfileSession::addMember(const RosterMember& member)
    {
        return impl->commit(AddMemberAction { member });
    }

    bool ProfileSession::updateMember(const RosterMemberId& id, const RosterMemberUpdate& update)
    {
        return impl->commit(UpdateMemberAction { id, update });
    }

    bool ProfileSession::removeMember(const RosterMemberId& id)
    {
        return impl->commit(RemoveMemberAction { id });
    }

    std::optional<AssignmentId> ProfileSession::createAssignment(const AssignmentDraft& draft, bool select)
    {
        Assignment assignment;
        assignment.id = impl->identifiers.newId(IdKind::assignment);
        assignment.name = draft.name;
        assignment.description = draft.description;
        assignment.assignmentType = draft.assignmentType;
        assignment.groupSetId = draft.groupSetId;
        assignment.groupSelection = draft.groupSelection;

        if (!addAssignment(assignment, select))
            return std::nullopt;

        return assignment.id;
    }

    bool ProfileSession::addAssignment(const Assignment& assignment, bool select)
    {
        if (!impl->commit(AddAssignmentAction { assignment }))
            return false;

        if (select)
        {
            impl->assignmentSelection = assignment.id;
            impl->notifyStateChanged();
        }

        return true;
    }

    bool ProfileSession::updateAssignment(const AssignmentId& id, const AssignmentUpdate& update)
    {
        return impl->commit(UpdateAssignmentAction { id, update });
    }

    bool ProfileSession::deleteAssignment(const AssignmentId& id)
    {
        const auto wasSelected = impl->assignmentSelection.has_value() && *impl->assignmentSelection == id;
        if (!impl->commit(DeleteAssignmentAction { id }))
            return false;

        if (wasSelected)
        {
            impl->assignmentSelection = Core::Integrity::defaultAssignmentSelection(impl->currentRoster());
            impl->notifyStateChanged();
        }

        return true;
    }

    std::optional<GroupId> ProfileSession::createGroup(const GroupSetId& groupSetId,
                                                       const juce::String& name,
                                                       const std::vector<RosterMemberId>& memberIds)
    {
        const auto groupId = impl->identifiers.newId(IdKind::group);
        if (!impl->commit(CreateGroupAction { groupSetId, groupId, name, memberIds }))
            return std::nullopt;

        return groupId;
    }

    bool ProfileSession::updateGroup(const GroupId& id, const GroupUpdate& update)
    {
        return impl->commit(UpdateGroupAction { id, update });
    }

    bool ProfileSession::deleteGroup(const GroupId& id)
    {
        return impl->commit(DeleteGroupAction { id });
    }

    bool ProfileSession::addGroupToSet(const GroupSetId& groupSetId, const GroupId& groupId)
    {
        return impl->commit(AddGroupToSetAction { groupSetId, groupId });
    }

    bool ProfileSession::removeGroupFromSet(const GroupSetId& groupSetId, const GroupId& groupId)
    {
        return impl->commit(RemoveGroupFromSetAction { groupSetId, groupId });
    }

    bool ProfileSession::moveMemberToGroup(const RosterMemberId& memberId,
                                           const GroupId& sourceGroupId,
                                           const GroupId& targetGroupId)
    {
        return impl->commit(MoveMemberToGroupAction { memberId, sourceGroupId, targetGroupId });
    }

    bool ProfileSession::copyMemberToGroup(const RosterMemberId& memberId, const GroupId& targetGroupId)
    {
        return impl->commit(CopyMemberToGroupAction { memberId, targetGroupId });
    }

    std::optional<GroupSetId> ProfileSession::createGroupSetWithMember(const RosterMemberId& memberId,
                                                                       const std::optional<GroupId>& sourceGroupId,
                                                                       MemberTransfer transfer)
    {
        const auto* roster = impl->currentRoster();
        if (roster == nullptr || Selectors::findMember(*roster, memberId) == nullptr)
            return std::nullopt;

        CreateGroupSetWithMemberAction action;
        action.memberId = memberId;
        action.sourceGroupId = sourceGroupId;
        action.transfer = transfer;
        action.groupSetId = impl->identifiers.newId(IdKind::groupSet);
        action.groupId = impl->identifiers.newId(IdKind::group);
        action.groupSetName = Core::Reducer::nextNewGroupSetName(roster);

        const auto groupSetId = action.groupSetId;
        if (!impl->commit(action))
            return std::nullopt;

        return groupSetId;
    }

    std::optional<GroupId> ProfileSession::createGroupInSetWithMember(const RosterMemberId& memberId,
                                                                      const GroupSetId& groupSetId,
                                                                      const std::optional<GroupId>& sourceGroupId,
                                                                      MemberTransfer transfer)
    {
        const auto* roster = impl->currentRoster();
        if (roster == nullptr || Selectors::findMember(*roster, memberId) == nullptr)
            return std::nullopt;

        CreateGroupInSetWithMemberAction action;
        action.memberId = memberId;
        action.groupSetId = groupSetId;
        action.sourceGroupId = sourceGroupId;
        action.transfer = transfer;
        action.groupId = impl->identifiers.newId(IdKind::group);

        const auto groupId = action.groupId;
        if (!impl->commit(action))
            return std::nullopt;

        return groupId;
    }

    std::optional<GroupSetId> ProfileSession::createLocalGroupSet(const juce::String& name,
                                                                  const std::vector<GroupId>& groupIds)
    {
        if (name.trim().isEmpty())
            return std::nullopt;

        const auto groupSetId = impl->identifiers.newId(IdKind::groupSet);
        if (!impl->commit(CreateLocalGroupSetAction { groupSetId, name, groupIds }))
            return std::nullopt;

        return groupSetId;
    }

    std::optional<GroupSetId> ProfileSession::copyGroupSet(const GroupSetId& id)
    {
        const auto copyId = impl->identifiers.newId(IdKind::groupSet);
        if (!impl->commit(CopyGroupSetAction { id, copyId }))
            return std::nullopt;

        return copyId;
    }

    bool ProfileSession::renameGroupSet(const GroupSetId& id, const juce::String& name)
    {
        if (name.trim().isEmpty())
            return false;

        return impl->commit(RenameGroupSetAction { id, name });
    }

    bool ProfileSession::deleteGroupSet(const GroupSetId& id)
    {
        return impl->commit(DeleteGroupSetAction { id });
    }

    bool ProfileSession::setRoster(Roster roster, const juce::String& description)
    {
        if (impl->store.snapshot() == nullptr)
            return false;

        const auto committed = impl->commit(SetRosterAction { std::move(roster), description });

        impl->assignmentSelection = Core::Integrity::reconcileAssignmentSelection(impl->currentRoster(),
                                                                                  impl->assignmentSelection);
        impl->systemSetsReady = false;
        impl->validation.clearAssignmentValidations();
        impl->ensureSystemGroupSets();
        impl->notifyStateChanged();
        return committed;
    }

    bool ProfileSession::cleanupOrphanedGroups()
    {
        return impl->commit(CleanupOrphanedGroupsAction {});
    }

    void ProfileSession::ensureSystemGroupSets()
    {
        impl->ensureSystemGroupSets();
    }

    bool ProfileSession::setCourse(const CourseInfo& course)
    {
        return impl->commit(SetCourseAction { course });
    }

    bool ProfileSession::setCourseVerifiedAt(const std::optional<juce::String>& timestamp)
    {
        return impl->commit(SetCourseVerifiedAtAction { timestamp });
    }

    bool ProfileSession::setGitConnection(const std::optional<juce::String>& name)
    {
        const auto mode = impl->appSettings.resolveIdentityMode(name);
        return impl->commit(SetGitConnectionAction { name, mode });
    }

    bool ProfileSession::setOperations(const OperationConfigs& operations)
    {
        return impl->commit(SetOperationsAction { operations });
    }

    bool ProfileSession::setExports(const ExportSettings& exports)
    {
        return impl->commit(SetExportsAction { exports });
    }

    void ProfileSession::updateResolvedIdentityMode()
    {
        impl->updateResolvedIdentityMode();
    }

    const std::optional<AssignmentId>& ProfileSession::getAssignmentSelection() const noexcept
    {
        return impl->assignmentSelection;
    }

    bool ProfileSession::setAssignmentSelection(const std::optional<AssignmentId>& assignmentId)
    {
        if (assignmentId.has_value() && !impl->hasAssignment(*assignmentId))
            return false;

        impl->assignmentSelection = assignmentId;
        impl->notifyStateChanged();
        return true;
    }

    const std::optional<ValidationResult>& ProfileSession::getRosterValidation() const noexcept
    {
        return impl->validation.getRosterValidation();
    }

    const std::map<AssignmentId, ValidationResult>& ProfileSession::getAssignmentValidations() const noexcept
    {
        return impl->validation.getAssignmentValidations();
    }

    const ValidationResult* ProfileSession::getSelectedAssignmentValidation() const noexcept
    {
        if (!impl->assignmentSelection.has_value())
            return nullptr;

        return impl->validation.findAssignmentValidation(*impl->assignmentSelection);
    }

    void ProfileSession::flushPendingValidation()
    {
        impl->validation.flushPending();
    }

    bool ProfileSession::hasPendingValidation() const noexcept
    {
        return impl->validation.hasPending();
    }

    std::optional<HistoryEntry> ProfileSession::undo()
    {
        auto entry = impl->store.undo();
        if (!entry.has_value())
            return std::nullopt;

        impl->repairSelection();
        impl->validation.scheduleAll();
        impl->ensureSystemGroupSets();
        impl->notifyStateChanged();
        return entry;
    }

    std::optional<HistoryEntry> ProfileSession::redo()
    {
        auto entry = impl->store.redo();
        if (!entry.has_value())
            return std::nullopt;

        impl->repairSelection();
        impl->validation.scheduleAll();
        impl->ensureSystemGroupSets();
        impl->notifyStateChanged();
        return entry;
    }

    bool ProfileSession::canUndo() const noexcept
    {
        return impl->store.canUndo();
    }

    bool ProfileSession::canRedo() const noexcept
    {
        return impl->store.canRedo();
    }

    size_t ProfileSession::undoDepth() const noexcept
    {
        return impl->store.undoDepth();
    }

    size_t ProfileSession::redoDepth() const noexcept
    {
        return impl->store.redoDepth();
    }

    std::optional<juce::String> ProfileSession::nextUndoDescription() const
    {
        return impl->store.nextUndoDescription();
    }

    std::optional<juce::String> ProfileSession::nextRedoDescription() const
    {
        return impl->store.nextRedoDescription();
    }

    void ProfileSession::clearHistory()
    {
        impl->store.clearHistory();
    }

    Selectors::RosterViews& ProfileSession::views()
    {
        impl->rosterViews.refresh(impl->store.snapshot());
        return impl->rosterViews;
    }

    void ProfileSession::setStateChangedCallback(std::function<void()> callback)
    {
        impl->stateChanged = std::move(callback);
    }
}
