#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "Classbook/Gateway/LocalCommandGateway.h"
#include "Classbook/Gateway/RosterValidator.h"
#include "Classbook/Gateway/SystemGroupSetBuilder.h"
#include "Classbook/Public/ProfileSession.h"

#include <algorithm>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <set>
#include <vector>

namespace
{
    using namespace Classbook;

    class SequentialIds final : public IdentifierService
    {
    public:
        juce::String newId(IdKind) override
        {
            return "id-" + juce::String(++counter);
        }

    private:
        int counter = 0;
    };

    // Gateway whose callbacks are queued until the test releases them, so calls can
    // complete late or out of order.
    class ScriptedGateway final : public CommandGateway
    {
    public:
        struct Profile
        {
            ProfileSettings settings;
            juce::String settingsError;
            std::optional<Roster> roster;
            juce::String rosterError;
        };

        explicit ScriptedGateway(IdentifierService& identifiersToUse)
            : identifiers(identifiersToUse)
        {
        }

        void loadProfile(const juce::String& profileName, LoadProfileCallback callback) override
        {
            post("loadProfile:" + profileName,
                 [this, profileName, callback]
                 {
                     const auto it = profiles.find(profileName);
                     if (it == profiles.end())
                     {
                         callback(juce::Result::fail("Profile not found: " + profileName), {});
                         return;
                     }

                     if (it->second.settingsError.isNotEmpty())
                     {
                         callback(juce::Result::fail(it->second.settingsError), {});
                         return;
                     }

                     LoadedProfile loaded;
                     loaded.settings = it->second.settings;
                     callback(juce::Result::ok(), loaded);
                 });
        }

        void getRoster(const juce::String& profileName, RosterCallback callback) override
        {
            post("getRoster:" + profileName,
                 [this, profileName, callback]
                 {
                     const auto it = profiles.find(profileName);
                     if (it != profiles.end() && it->second.rosterError.isNotEmpty())
                     {
                         callback(juce::Result::fail(it->second.rosterError), {});
                         return;
                     }

                     const auto roster = it != profiles.end() ? it->second.roster.value_or(Roster {}) : Roster {};
                     callback(juce::Result::ok(), roster);
                 });
        }

        void saveProfileAndRoster(const juce::String& profileName,
                                  const ProfileSettings& settings,
                                  const std::optional<Roster>& roster,
                                  SaveCallback callback) override
        {
            post("save:" + profileName,
                 [this, profileName, settings, roster, callback]
                 {
                     ++saveCount;
                     auto& profile = profiles[profileName];
                     profile.settings = settings;
                     profile.roster = roster;
                     callback(juce::Result::ok());
                 });
        }

        void validateRoster(const Roster& roster, ValidationCallback callback) override
        {
            ++rosterValidationCalls;
            post("validateRoster",
                 [roster, callback]
                 {
                     callback(juce::Result::ok(), Gateway::RosterValidator::validateRoster(roster));
                 });
        }

        void validateAssignment(GitIdentityMode identityMode,
                                const Roster& roster,
                                const AssignmentId& assignmentId,
                                ValidationCallback callback) override
        {
            ++assignmentValidationCalls;
            post("validateAssignment",
                 [identityMode, roster, assignmentId, callback]
                 {
                     callback(juce::Result::ok(),
                              Gateway::RosterValidator::validateAssignment(roster, assignmentId, identityMode));
                 });
        }

        void ensureSystemGroupSets(const Roster& roster, SystemGroupSetCallback callback) override
        {
            post("ensureSystemGroupSets",
                 [this, roster, callback]
                 {
                     callback(juce::Result::ok(), Gateway::SystemGroupSetBuilder::buildPatch(roster, identifiers));
                 });
        }

        juce::Result getDefaultSettings(ProfileSettings& settingsOut) override
        {
            settingsOut = makeDefaultProfileSettings();
            settingsOut.course.name = "Defaults";
            return juce::Result::ok();
        }

        bool runNext(const juce::String& label)
        {
            const auto it = std::find_if(queue.begin(),
                                         queue.end(),
                                         [&label](const auto& entry)
                                         {
                                             return entry.first == label;
                                         });
            if (it == queue.end())
                return false;

            auto run = std::move(it->second);
            queue.erase(it);
            run();
            return true;
        }

        void runAll()
        {
            for (int guard = 0; guard < 1000 && !queue.empty(); ++guard)
            {
                auto run = std::move(queue.front().second);
                queue.pop_front();
                run();
            }
        }

        std::map<juce::String, Profile> profiles;
        int saveCount = 0;
        int rosterValidationCalls = 0;
        int assignmentValidationCalls = 0;

    private:
        void post(const juce::String& label, std::function<void()> run)
        {
            queue.emplace_back(label, std::move(run));
        }

        IdentifierService& identifiers;
        std::deque<std::pair<juce::String, std::function<void()>>> queue;
    };

    RosterMember makeMember(const juce::String& id,
                            const juce::String& name,
                            EnrollmentType enrollment = EnrollmentType::student)
    {
        RosterMember member;
        member.id = id;
        member.name = name;
        member.email = id + "@example.com";
        member.enrollmentType = enrollment;
        return member;
    }

    Roster makeRoster()
    {
        Roster roster;
        roster.students = { makeMember("s1", "Alice Smith"), makeMember("s2", "Bob Jones"), makeMember("s3", "Carol White") };
        roster.staff = { makeMember("t1", "Dana Teacher", EnrollmentType::teacher) };

        Group g1;
        g1.id = "g1";
        g1.name = "Team 1";
        g1.memberIds = { "s1", "s2" };
        Group g2;
        g2.id = "g2";
        g2.name = "Team 2";
        g2.memberIds = { "s3" };
        roster.groups = { g1, g2 };

        GroupSet projects;
        projects.id = "gs1";
        projects.name = "Projects";
        projects.groupIds = { "g1", "g2" };
        GroupSet labs;
        labs.id = "gs2";
        labs.name = "Labs";
        labs.groupIds = { "g2" };
        roster.groupSets = { projects, labs };

        Assignment first;
        first.id = "a1";
        first.name = "Lab 1";
        first.groupSetId = "gs1";
        Assignment second;
        second.id = "a2";
        second.name = "Lab 2";
        second.groupSetId = "gs2";
        roster.assignments = { first, second };
        return roster;
    }

    ScriptedGateway::Profile makeProfile(const juce::String& courseName)
    {
        ScriptedGateway::Profile profile;
        profile.settings = makeDefaultProfileSettings();
        profile.settings.course = { courseName.toLowerCase().replaceCharacter(' ', '-'), courseName };
        profile.roster = makeRoster();
        return profile;
    }

    struct Fixture
    {
        Fixture()
        {
            gateway.profiles["cs101"] = makeProfile("CS 101");
        }

        ProfileLoadResult loadAndSettle(const juce::String& profileName)
        {
            ProfileLoadResult outcome;
            session.load(profileName,
                         [&outcome](const ProfileLoadResult& result)
                         {
                             outcome = result;
                         });
            gateway.runAll();
            return outcome;
        }

        SequentialIds ids;
        GitConnectionRegistry registry;
        ScriptedGateway gateway { ids };
        ProfileSession session { gateway, ids, registry };
    };

    bool hasIssue(const ValidationResult& result, ValidationKind kind, const juce::String& affectedId = {})
    {
        return std::any_of(result.issues.begin(),
                           result.issues.end(),
                           [&](const ValidationIssue& issue)
                           {
                               if (issue.kind != kind)
                                   return false;

                               return affectedId.isEmpty()
                                   || std::find(issue.affectedIds.begin(), issue.affectedIds.end(), affectedId)
                                          != issue.affectedIds.end();
                           });
    }

    juce::Result checkOneSetPerSystemType(const Roster& roster, const juce::String& context)
    {
        std::map<SystemSetType, int> setsPerType;
        std::set<GroupId> referenced;
        for (const auto& groupSet : roster.groupSets)
        {
            referenced.insert(groupSet.groupIds.begin(), groupSet.groupIds.end());
            if (const auto systemType = systemTypeOf(groupSet))
                ++setsPerType[*systemType];
        }

        if (setsPerType[SystemSetType::individualStudents] != 1 || setsPerType[SystemSetType::staff] != 1)
            return juce::Result::fail(context + ": expected exactly one set per system type");

        for (const auto& group : roster.groups)
        {
            if (referenced.count(group.id) == 0)
                return juce::Result::fail(context + ": orphaned group " + group.id);
        }

        return juce::Result::ok();
    }

    juce::Result testLoadInstallsDocumentAndSystemSets()
    {
        Fixture fixture;
        int notifications = 0;
        fixture.session.setStateChangedCallback([&notifications] { ++notifications; });

        ProfileLoadResult outcome;
        fixture.session.load("cs101", [&outcome](const ProfileLoadResult& result) { outcome = result; });
        if (fixture.session.getStatus() != SessionStatus::loading)
            return juce::Result::fail("status must be loading while the gateway works");

        fixture.gateway.runAll();

        if (!outcome.ok || outcome.stale || fixture.session.getStatus() != SessionStatus::loaded)
            return juce::Result::fail("load must complete successfully");

        const auto document = fixture.session.document();
        if (document == nullptr || !document->roster.has_value() || document->settings.course.name != "CS 101")
            return juce::Result::fail("document must hold the loaded settings and roster");
        if (!fixture.session.areSystemSetsReady())
            return juce::Result::fail("system sets must be ready after the patch arrives");

        const auto& roster = *document->roster;
        const auto* individual = Selectors::systemSet(roster, SystemSetType::individualStudents);
        const auto* staff = Selectors::systemSet(roster, SystemSetType::staff);
        if (individual == nullptr || staff == nullptr || individual->groupIds.size() != 3 || staff->groupIds.size() != 1)
            return juce::Result::fail("system sets must hold one group per active member");
        if (fixture.session.canUndo())
            return juce::Result::fail("loading and system set repair must not record history");
        if (fixture.session.getAssignmentSelection().value_or("") != "a1")
            return juce::Result::fail("first assignment must be selected after load");
        if (notifications == 0)
            return juce::Result::fail("observers must be notified");

        return juce::Result::ok();
    }

    juce::Result testStaleLoadIsDiscarded()
    {
        Fixture fixture;
        fixture.gateway.profiles["cs202"] = makeProfile("CS 202");

        ProfileLoadResult first;
        ProfileLoadResult second;
        fixture.session.load("cs101", [&first](const ProfileLoadResult& result) { first = result; });
        fixture.session.load("cs202", [&second](const ProfileLoadResult& result) { second = result; });

        fixture.gateway.runNext("getRoster:cs202");
        fixture.gateway.runNext("loadProfile:cs202");
        if (!second.ok)
            return juce::Result::fail("newer load must complete");

        fixture.gateway.runAll();

        if (!first.stale || first.ok)
            return juce::Result::fail("older load must report stale");
        if (fixture.session.document()->settings.course.name != "CS 202")
            return juce::Result::fail("stale result must not replace the newer document");
        if (fixture.session.getStatus() != SessionStatus::loaded)
            return juce::Result::fail("stale completion must not touch status");

        return juce::Result::ok();
    }

    juce::Result testSettingsFailureFallsBackToDefaults()
    {
        Fixture fixture;
        fixture.gateway.profiles["cs101"].settingsError = "disk unavailable";

        const auto outcome = fixture.loadAndSettle("cs101");

        if (outcome.ok || outcome.error.value_or("") != "settings: disk unavailable")
            return juce::Result::fail("settings failure must be reported with its source");
        if (fixture.session.getStatus() != SessionStatus::error)
            return juce::Result::fail("status must be error");

        const auto document = fixture.session.document();
        if (document == nullptr || document->settings.course.name != "Defaults")
            return juce::Result::fail("default settings must be installed");
        if (!document->roster.has_value() || document->roster->students.size() != 3)
            return juce::Result::fail("roster that did load must be kept");

        return juce::Result::ok();
    }

    juce::Result testRosterFailureKeepsSettings()
    {
        Fixture fixture;
        fixture.gateway.profiles["cs101"].rosterError = "corrupt roster";

        const auto outcome = fixture.loadAndSettle("cs101");

        if (outcome.ok || outcome.error.value_or("") != "roster: corrupt roster")
            return juce::Result::fail("roster failure must be reported with its source");
        if (fixture.session.getStatus() != SessionStatus::error)
            return juce::Result::fail("status must be error");

        const auto document = fixture.session.document();
        if (document == nullptr || document->settings.course.name != "CS 101" || document->roster.has_value())
            return juce::Result::fail("settings must load without a roster");
        if (fixture.session.areSystemSetsReady())
            return juce::Result::fail("system sets cannot be ready without a roster");
        if (fixture.session.setCourse({ "cs101", "CS 101 Fall" }) == false)
            return juce::Result::fail("settings stay editable without a roster");

        return juce::Result::ok();
    }

    juce::Result testDebouncedValidation()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");

        if (!fixture.session.hasPendingValidation())
            return juce::Result::fail("load must schedule validation");
        if (fixture.gateway.rosterValidationCalls != 0)
            return juce::Result::fail("validation must wait for the quiet period");

        fixture.session.flushPendingValidation();
        fixture.gateway.runAll();

        if (fixture.gateway.rosterValidationCalls != 1)
            return juce::Result::fail("scheduled runs must coalesce into one roster validation");
        if (!fixture.session.getRosterValidation().has_value())
            return juce::Result::fail("roster validation result must be stored");
        if (hasIssue(*fixture.session.getRosterValidation(), ValidationKind::systemGroupSetsMissing))
            return juce::Result::fail("validated roster already has its system sets");

        for (int i = 0; i < 3; ++i)
            fixture.session.setCourse({ "cs101", "CS 101 rev " + juce::String(i) });

        if (fixture.gateway.rosterValidationCalls != 1 || !fixture.session.hasPendingValidation())
            return juce::Result::fail("edits must re-arm the debounce without dispatching");

        fixture.session.addMember(makeMember("s4", "Erin Black"));
        fixture.session.flushPendingValidation();
        fixture.gateway.runAll();

        if (fixture.gateway.rosterValidationCalls != 2)
            return juce::Result::fail("a burst of edits must yield a single validation");

        const auto* selected = fixture.session.getSelectedAssignmentValidation();
        if (selected == nullptr || !hasIssue(*selected, ValidationKind::studentMissingFromAssignment, "s4"))
            return juce::Result::fail("selected assignment must report the new unassigned student");
        if (fixture.session.getAssignmentValidations().size() != 2 || fixture.gateway.assignmentValidationCalls != 4)
            return juce::Result::fail("every assignment must be validated");

        const auto roundsBefore = fixture.gateway.rosterValidationCalls;
        if (fixture.session.renameGroupSet("gs1", "Projects"))
            return juce::Result::fail("renaming to the same name changes nothing");
        if (fixture.session.hasPendingValidation())
            return juce::Result::fail("no-op edits must not schedule validation");

        fixture.session.flushPendingValidation();
        if (fixture.gateway.rosterValidationCalls != roundsBefore)
            return juce::Result::fail("flushing with nothing pending must not dispatch");

        return juce::Result::ok();
    }

    juce::Result testSelectionFollowsDocument()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        if (!session.setAssignmentSelection(AssignmentId("a2")) || session.getAssignmentSelection().value_or("") != "a2")
            return juce::Result::fail("existing assignment must be selectable");
        if (session.setAssignmentSelection(AssignmentId("nope")))
            return juce::Result::fail("unknown assignment must not be selectable");

        if (!session.deleteAssignment("a2") || session.getAssignmentSelection().value_or("") != "a1")
            return juce::Result::fail("deleting the selection must fall back to the first assignment");

        session.undo();
        if (session.getAssignmentSelection().value_or("") != "a1")
            return juce::Result::fail("undo keeps a still valid selection");

        session.setAssignmentSelection(AssignmentId("a2"));
        session.redo();
        if (session.getAssignmentSelection().value_or("") != "a1")
            return juce::Result::fail("redo that removes the selection must repair it");

        auto replacement = *session.document()->roster;
        replacement.assignments.erase(replacement.assignments.begin());
        Assignment finals;
        finals.id = "a3";
        finals.name = "Finals";
        finals.groupSetId = "gs1";
        replacement.assignments.push_back(finals);

        if (!session.setRoster(replacement, "Import roster"))
            return juce::Result::fail("setRoster must commit");
        if (session.getAssignmentSelection().value_or("") != "a3")
            return juce::Result::fail("setRoster must reconcile the selection");
        if (session.areSystemSetsReady())
            return juce::Result::fail("system sets must be re-checked after setRoster");
        if (session.nextUndoDescription().value_or("") != "Import roster")
            return juce::Result::fail("setRoster must record its description");

        fixture.gateway.runAll();
        if (!session.areSystemSetsReady())
            return juce::Result::fail("system sets must be ready after the repair patch");

        AssignmentDraft draft;
        draft.name = "Project";
        draft.groupSetId = "gs1";
        const auto created = session.createAssignment(draft, true);
        if (!created.has_value() || session.getAssignmentSelection() != created)
            return juce::Result::fail("createAssignment with select must select the new assignment");

        return juce::Result::ok();
    }

    juce::Result testSaveClearsHistory()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        session.setCourse({ "cs101", "CS 101 Spring" });
        if (!session.canUndo())
            return juce::Result::fail("edit must be undoable");

        bool saved = false;
        session.save("cs101", [&saved](bool ok) { saved = ok; });
        if (session.getStatus() != SessionStatus::loading)
            return juce::Result::fail("status must be loading while saving");

        fixture.gateway.runAll();

        if (!saved || session.getStatus() != SessionStatus::loaded || fixture.gateway.saveCount != 1)
            return juce::Result::fail("save must succeed");
        if (session.canUndo() || session.canRedo())
            return juce::Result::fail("save must clear history");
        if (fixture.gateway.profiles["cs101"].settings.course.name != "CS 101 Spring")
            return juce::Result::fail("gateway must receive the current settings");

        session.setCourse({ "cs101", "CS 101 Summer" });
        bool lateSave = true;
        session.save("cs101", [&lateSave](bool ok) { lateSave = ok; });
        session.load("cs101");
        fixture.gateway.runAll();

        if (lateSave)
            return juce::Result::fail("save finishing after a newer load must be ignored");
        if (session.getStatus() != SessionStatus::loaded || session.canUndo())
            return juce::Result::fail("newer load must own the session");

        return juce::Result::ok();
    }

    juce::Result testUndoRedoThroughSession()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        if (!session.addMember(makeMember("s4", "Erin Black")) || !session.removeMember("s4"))
            return juce::Result::fail("member edits must commit");
        if (session.nextUndoDescription().value_or("") != "Remove member Erin Black")
            return juce::Result::fail("unexpected undo description");

        const auto undone = session.undo();
        if (!undone.has_value() || Selectors::findMember(*session.document()->roster, "s4") == nullptr)
            return juce::Result::fail("undo must restore the member");
        if (session.nextRedoDescription().value_or("") != "Remove member Erin Black")
            return juce::Result::fail("redo description must follow the undone entry");

        session.undo();
        if (Selectors::findMember(*session.document()->roster, "s4") != nullptr || session.canUndo())
            return juce::Result::fail("second undo must remove the added member");

        if (!session.redo().has_value() || session.redoDepth() != 1)
            return juce::Result::fail("redo must replay the addition");
        if (session.removeMember("missing"))
            return juce::Result::fail("unknown member removal must be refused");
        if (session.redoDepth() != 1)
            return juce::Result::fail("refused edit must not discard the redo branch");

        return juce::Result::ok();
    }

    juce::Result testRosterImportUndoKeepsSystemSets()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        const auto loadedRoster = *session.document()->roster;
        if (const auto check = checkOneSetPerSystemType(loadedRoster, "after load"); check.failed())
            return check;

        auto imported = makeRoster();
        imported.students.push_back(makeMember("s4", "Erin Black"));
        if (!session.setRoster(imported, "Import roster"))
            return juce::Result::fail("setRoster must commit");

        fixture.gateway.runAll();
        if (const auto check = checkOneSetPerSystemType(*session.document()->roster, "after import"); check.failed())
            return check;

        if (!session.undo().has_value())
            return juce::Result::fail("import must be undoable");

        fixture.gateway.runAll();
        if (const auto check = checkOneSetPerSystemType(*session.document()->roster, "after undo"); check.failed())
            return check;
        if (!(*session.document()->roster == loadedRoster))
            return juce::Result::fail("undo must bring back the roster the import replaced");

        if (!session.redo().has_value())
            return juce::Result::fail("import must be redoable");

        fixture.gateway.runAll();
        const auto& redone = *session.document()->roster;
        if (const auto check = checkOneSetPerSystemType(redone, "after redo"); check.failed())
            return check;

        const auto* individual = Selectors::systemSet(redone, SystemSetType::individualStudents);
        if (individual == nullptr || individual->groupIds.size() != 4)
            return juce::Result::fail("redone import must get one singleton group per student");

        return juce::Result::ok();
    }

    juce::Result testRosterValidationClearedWithRoster()
    {
        Fixture fixture;
        fixture.gateway.profiles["cs101"].rosterError = "corrupt roster";
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        if (!session.addMember(makeMember("s1", "Alice Smith")) || !session.document()->roster.has_value())
            return juce::Result::fail("first member must create the roster");

        session.flushPendingValidation();
        fixture.gateway.runAll();
        if (!session.getRosterValidation().has_value())
            return juce::Result::fail("created roster must be validated");

        if (!session.undo().has_value() || session.document()->roster.has_value())
            return juce::Result::fail("undo must remove the created roster");

        session.flushPendingValidation();
        fixture.gateway.runAll();
        if (session.getRosterValidation().has_value())
            return juce::Result::fail("roster validation must be cleared along with the roster");

        return juce::Result::ok();
    }

    juce::Result testMemoizedViews()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        const auto& local = session.views().localGroupSets();
        if (local.size() != 2)
            return juce::Result::fail("two local sets expected");

        session.views().rosterCounts();
        const auto computed = session.views().getRecomputationCount();
        session.views().localGroupSets();
        session.views().rosterCounts();
        if (session.views().getRecomputationCount() != computed)
            return juce::Result::fail("same snapshot must be served from cache");

        session.setCourse({ "cs101", "Renamed" });
        session.views().localGroupSets();
        if (session.views().getRecomputationCount() != computed + 1)
            return juce::Result::fail("a new snapshot must recompute on demand");
        if (session.views().rosterCounts().activeStudents != 3)
            return juce::Result::fail("counts must reflect the roster");

        return juce::Result::ok();
    }

    juce::Result testIdentityModeResolution()
    {
        Fixture fixture;
        fixture.loadAndSettle("cs101");
        auto& session = fixture.session;

        GitConnection gitLab;
        gitLab.serverType = GitServerType::gitLab;
        gitLab.baseUrl = "https://git.example.edu";
        gitLab.identityMode = GitIdentityMode::email;
        fixture.registry.setConnection("school", gitLab);

        if (!session.setGitConnection(juce::String("school")))
            return juce::Result::fail("git connection change must commit");
        if (session.document()->resolvedIdentityMode != GitIdentityMode::email)
            return juce::Result::fail("GitLab connection must resolve to its identity mode");

        gitLab.identityMode = GitIdentityMode::username;
        fixture.registry.setConnection("school", gitLab);
        const auto depth = session.undoDepth();
        session.updateResolvedIdentityMode();

        if (session.document()->resolvedIdentityMode != GitIdentityMode::username)
            return juce::Result::fail("identity mode must follow the app settings");
        if (session.undoDepth() != depth)
            return juce::Result::fail("re-resolving the identity mode is not an undoable edit");

        return juce::Result::ok();
    }

    juce::Result testLocalGatewayEndToEnd()
    {
        const auto root = juce::File::getSpecialLocation(juce::File::tempDirectory)
                              .getNonexistentChildFile("classbook-session-smoke", "");
        if (const auto created = root.createDirectory(); created.failed())
            return created;

        const auto run = [&root]() -> juce::Result
        {
            SequentialIds ids;
            GitConnectionRegistry registry;
            Gateway::LocalCommandGateway gateway(root, ids);

            Roster savedRoster;
            {
                ProfileSession session(gateway, ids, registry);

                ProfileLoadResult outcome;
                session.load("demo", [&outcome](const ProfileLoadResult& result) { outcome = result; });
                if (outcome.ok || !outcome.error.value_or("").startsWith("settings: Profile not found"))
                    return juce::Result::fail("missing profile must fail to load");
                if (session.document() == nullptr || !session.areSystemSetsReady())
                    return juce::Result::fail("defaults with an empty roster must be installed and repaired");

                session.addMember(makeMember("s1", "Alice Smith"));
                session.addMember(makeMember("s2", "Bob Jones"));
                const auto setId = session.createLocalGroupSet("Projects");
                if (!setId.has_value() || !session.createGroup(*setId, "Team 1", { "s1", "s2" }).has_value())
                    return juce::Result::fail("local set and group must be created");

                session.ensureSystemGroupSets();

                bool saved = false;
                session.save("demo", [&saved](bool ok) { saved = ok; });
                if (!saved || session.getStatus() != SessionStatus::loaded)
                    return juce::Result::fail("save to disk must succeed");

                savedRoster = *session.document()->roster;
            }

            if (!gateway.listProfiles().contains("demo"))
                return juce::Result::fail("saved profile must be listed");

            ProfileSession reopened(gateway, ids, registry);
            ProfileLoadResult outcome;
            reopened.load("demo", [&outcome](const ProfileLoadResult& result) { outcome = result; });
            if (!outcome.ok || reopened.getStatus() != SessionStatus::loaded)
                return juce::Result::fail("saved profile must load: " + outcome.error.value_or(""));
            if (!(*reopened.document()->roster == savedRoster))
                return juce::Result::fail("roster must survive save and load");

            reopened.flushPendingValidation();
            const auto& validation = reopened.getRosterValidation();
            if (!validation.has_value() || hasBlockingIssues(*validation))
                return juce::Result::fail("saved roster must validate without blocking issues");

            return gateway.deleteProfile("demo");
        };

        const auto result = run();
        root.deleteRecursively();
        return result;
    }
}

int main()
{
    juce::ScopedJuceInitialiser_GUI juceInitialiser;

    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Load installs document and system sets", testLoadInstallsDocumentAndSystemSets },
        { "Stale load is discarded", testStaleLoadIsDiscarded },
        { "Settings failure falls back to defaults", testSettingsFailureFallsBackToDefaults },
        { "Roster failure keeps settings", testRosterFailureKeepsSettings },
        { "Debounced validation", testDebouncedValidation },
        { "Selection follows document", testSelectionFollowsDocument },
        { "Save clears history", testSaveClearsHistory },
        { "Undo/Redo through session", testUndoRedoThroughSession },
        { "Roster import undo keeps system sets", testRosterImportUndoKeepsSystemSets },
        { "Roster validation cleared with roster", testRosterValidationClearedWithRoster },
        { "Memoized views", testMemoizedViews },
        { "Identity mode resolution", testIdentityModeResolution },
        { "Local gateway end to end", testLocalGatewayEndToEnd }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Classbook session smoke passed." << std::endl;
    return 0;
}
