#include <juce_core/juce_core.h>

#include "Classbook/Core/DocumentStore.h"
#include "Classbook/Core/Integrity.h"
#include "Classbook/Core/SystemGroupSets.h"
#include "Classbook/Gateway/RosterValidator.h"
#include "Classbook/Gateway/SystemGroupSetBuilder.h"
#include "Classbook/Public/Selectors.h"
#include "Classbook/Serialization/RosterJson.h"

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace
{
    using namespace Classbook;

    class SequentialIds final : public IdentifierService
    {
    public:
        juce::String newId(IdKind) override
        {
            return "gen-" + juce::String(++counter);
        }

    private:
        int counter = 0;
    };

    RosterMember makeMember(const juce::String& id,
                            const juce::String& name,
                            const juce::String& email,
                            EnrollmentType enrollment = EnrollmentType::student)
    {
        RosterMember member;
        member.id = id;
        member.name = name;
        member.email = email;
        member.enrollmentType = enrollment;
        return member;
    }

    Group makeGroup(const juce::String& id,
                    const juce::String& name,
                    std::vector<RosterMemberId> memberIds,
                    GroupOrigin origin = GroupOrigin::local)
    {
        Group group;
        group.id = id;
        group.name = name;
        group.memberIds = std::move(memberIds);
        group.origin = origin;
        return group;
    }

    GroupSet makeGroupSet(const juce::String& id,
                          const juce::String& name,
                          std::vector<GroupId> groupIds,
                          GroupSetConnection connection = LocalConnection {})
    {
        GroupSet groupSet;
        groupSet.id = id;
        groupSet.name = name;
        groupSet.groupIds = std::move(groupIds);
        groupSet.connection = std::move(connection);
        return groupSet;
    }

    Assignment makeAssignment(const juce::String& id, const juce::String& name, const GroupSetId& groupSetId)
    {
        Assignment assignment;
        assignment.id = id;
        assignment.name = name;
        assignment.groupSetId = groupSetId;
        return assignment;
    }

    // Three students, one teacher, two local sets sharing g2, one system set.
    Core::DocumentPtr makeBaseDocument()
    {
        Roster roster;
        roster.students = { makeMember("s1", "Alice Smith", "alice@example.com"),
                            makeMember("s2", "Bob Jones", "bob@example.com"),
                            makeMember("s3", "Carol White", "carol@example.com") };
        roster.staff = { makeMember("t1", "Dana Teacher", "dana@example.com", EnrollmentType::teacher) };
        roster.groups = { makeGroup("g1", "Team 1", { "s1", "s2" }),
                          makeGroup("g2", "Team 2", { "s3" }),
                          makeGroup("sg1", "alice_smith", { "s1" }, GroupOrigin::system) };
        roster.groupSets = { makeGroupSet("gs1", "Projects", { "g1", "g2" }),
                             makeGroupSet("gs2", "Labs", { "g2" }),
                             makeGroupSet("sys", "Individual Students", { "sg1" },
                                          SystemConnection { SystemSetType::individualStudents }) };
        roster.assignments = { makeAssignment("a1", "Lab 1", "gs1") };

        ProfileDocument document;
        document.settings.course = { "course-1", "Data Structures" };
        document.roster = std::move(roster);
        return std::make_shared<const ProfileDocument>(std::move(document));
    }

    const Roster& rosterOf(const Core::DocumentStore& store)
    {
        return *store.snapshot()->roster;
    }

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

    // What the session does once the synchronizer answers: merge outside history.
    void synchronizeSystemSets(Core::DocumentStore& store, IdentifierService& ids)
    {
        auto next = std::make_shared<ProfileDocument>(*store.snapshot());
        const auto patch = Gateway::SystemGroupSetBuilder::buildPatch(*next->roster, ids);
        Core::SystemGroupSets::mergePatch(*next->roster, patch);
        store.replaceWithoutHistory(std::move(next));
    }

    juce::Result checkSystemSetInvariants(const Roster& roster, const juce::String& context)
    {
        if (Core::SystemGroupSets::systemSetsMissing(roster))
            return juce::Result::fail(context + ": system sets missing");

        std::map<SystemSetType, int> setsPerType;
        for (const auto& groupSet : roster.groupSets)
        {
            if (const auto systemType = systemTypeOf(groupSet))
                ++setsPerType[*systemType];
        }

        for (const auto& [type, count] : setsPerType)
        {
            if (count != 1)
                return juce::Result::fail(context + ": " + juce::String(count) + " sets share the system type "
                                          + systemSetTypeToKey(type));
        }

        const auto referenced = Core::Integrity::collectReferencedGroupIds(roster);
        for (const auto& group : roster.groups)
        {
            if (referenced.count(group.id) == 0)
                return juce::Result::fail(context + ": orphaned group " + group.id);
        }

        return juce::Result::ok();
    }

    juce::Result testReadOnlyGuardsAndIdempotentRename()
    {
        CanvasConnection canvas;
        canvas.courseId = "course-1";
        canvas.groupSetId = "canvas-gs-1";

        auto withLms = std::make_shared<ProfileDocument>(*makeBaseDocument());
        withLms->roster->groups.push_back(makeGroup("lg1", "Canvas Team", { "s2" }, GroupOrigin::lms));
        withLms->roster->groupSets.push_back(makeGroupSet("lms", "Canvas Groups", { "lg1" }, canvas));

        Core::DocumentStore store;
        store.reset(std::move(withLms));
        const auto before = store.snapshot();

        if (store.apply(RenameGroupSetAction { "sys", "Everyone" }).wasOk())
            return juce::Result::fail("renaming a system set must fail");
        if (store.apply(DeleteGroupSetAction { "sys" }).wasOk())
            return juce::Result::fail("deleting a system set must fail");
        if (store.apply(DeleteGroupAction { "sg1" }).wasOk())
            return juce::Result::fail("deleting a system group must fail");

        GroupUpdate rename;
        rename.name = juce::String("Renamed");
        if (store.apply(UpdateGroupAction { "sg1", rename }).wasOk())
            return juce::Result::fail("editing a system group must fail");
        if (store.apply(AddGroupToSetAction { "sys", "g1" }).wasOk())
            return juce::Result::fail("adding to a system set must fail");
        if (store.apply(CreateGroupAction { "sys", "g-new", "Nope", {} }).wasOk())
            return juce::Result::fail("creating a group in a system set must fail");
        if (store.apply(CreateGroupAction { "lms", "g-new", "Nope", {} }).wasOk())
            return juce::Result::fail("creating a group in an LMS set must fail");
        if (store.apply(AddGroupToSetAction { "lms", "g1" }).wasOk())
            return juce::Result::fail("adding a local group to an LMS set must fail");
        if (store.apply(RemoveGroupFromSetAction { "lms", "lg1" }).wasOk())
            return juce::Result::fail("removing a group from an LMS set must fail");
        if (store.apply(RenameGroupSetAction { "gs1", "   " }).wasOk())
            return juce::Result::fail("blank rename must fail");

        if (store.snapshot() != before || store.undoDepth() != 0)
            return juce::Result::fail("refused actions must leave document and history untouched");

        auto outcome = Core::DocumentStore::ApplyOutcome::committed;
        const auto sameName = store.apply(RenameGroupSetAction { "gs1", "Projects" }, &outcome);
        if (sameName.failed() || outcome != Core::DocumentStore::ApplyOutcome::unchanged)
            return juce::Result::fail("renaming to the current name must be an unchanged no-op");
        if (store.undoDepth() != 0)
            return juce::Result::fail("unchanged rename must not record history");

        const auto renamed = store.apply(RenameGroupSetAction { "gs1", "  Projects 2 " }, &outcome);
        if (renamed.failed() || outcome != Core::DocumentStore::ApplyOutcome::committed)
            return juce::Result::fail("rename failed: " + renamed.getErrorMessage());
        if (store.nextUndoDescription().value_or("") != "Rename group set Projects 2")
            return juce::Result::fail("unexpected undo description: " + store.nextUndoDescription().value_or(""));
        if (Selectors::findGroupSet(rosterOf(store), "gs1")->name != "Projects 2")
            return juce::Result::fail("rename must trim the name");

        return juce::Result::ok();
    }

    juce::Result testUndoRedoRoundTrip()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());

        RosterMemberUpdate memberUpdate;
        memberUpdate.name = juce::String("Alicia Smith");

        AssignmentUpdate assignmentUpdate;
        assignmentUpdate.name = juce::String("Lab One");

        const std::vector<Action> actions = {
            AddMemberAction { makeMember("s4", "Erin Black", "erin@example.com") },
            UpdateMemberAction { "s1", memberUpdate },
            CreateGroupAction { "gs1", "g-new", "Team New", { "s4" } },
            MoveMemberToGroupAction { "s2", "g1", "g-new" },
            CopyGroupSetAction { "gs1", "gs-copy" },
            UpdateAssignmentAction { "a1", assignmentUpdate },
            DeleteGroupSetAction { "gs2" },
            SetCourseAction { CourseInfo { "course-2", "Algorithms" } },
            DeleteAssignmentAction { "a1" }
        };

        std::vector<Core::DocumentPtr> states { store.snapshot() };
        for (const auto& action : actions)
        {
            auto outcome = Core::DocumentStore::ApplyOutcome::unchanged;
            const auto result = store.apply(action, &outcome);
            if (result.failed())
                return juce::Result::fail("action failed: " + result.getErrorMessage());
            if (outcome != Core::DocumentStore::ApplyOutcome::committed)
                return juce::Result::fail("action did not change the document");

            states.push_back(store.snapshot());
        }

        const auto& moved = *Selectors::findGroup(rosterOf(store), "g-new");
        if (moved.memberIds != std::vector<RosterMemberId> { "s4", "s2" })
            return juce::Result::fail("move must append the member to the target group");

        for (size_t step = actions.size(); step > 0; --step)
        {
            if (!store.undo().has_value())
                return juce::Result::fail("undo failed at step " + juce::String(static_cast<int>(step)));
            if (*store.snapshot() != *states[step - 1])
                return juce::Result::fail("undo mismatch at step " + juce::String(static_cast<int>(step)));
        }

        for (size_t step = 1; step <= actions.size(); ++step)
        {
            if (!store.redo().has_value())
                return juce::Result::fail("redo failed at step " + juce::String(static_cast<int>(step)));
            if (*store.snapshot() != *states[step])
                return juce::Result::fail("redo mismatch at step " + juce::String(static_cast<int>(step)));
        }

        if (store.canRedo())
            return juce::Result::fail("redo stack must be empty after replaying everything");

        return juce::Result::ok();
    }

    juce::Result testHistoryBound()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());

        for (int i = 1; i <= 150; ++i)
        {
            const auto result = store.apply(SetCourseAction { CourseInfo { "course-1", "Course " + juce::String(i) } });
            if (result.failed())
                return result;
        }

        if (store.undoDepth() != 100)
            return juce::Result::fail("history must be capped at 100, got " + juce::String(static_cast<int>(store.undoDepth())));

        int undone = 0;
        while (store.undo().has_value())
            ++undone;

        if (undone != 100)
            return juce::Result::fail("expected 100 undo steps");
        if (store.snapshot()->settings.course.name != "Course 50")
            return juce::Result::fail("oldest reachable state must be Course 50, got " + store.snapshot()->settings.course.name);

        return juce::Result::ok();
    }

    juce::Result testBranchDiscard()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());

        store.apply(SetCourseAction { CourseInfo { "c", "A" } });
        store.apply(SetCourseAction { CourseInfo { "c", "B" } });
        store.undo();
        if (!store.canRedo())
            return juce::Result::fail("redo must be available after undo");

        const auto result = store.apply(SetCourseAction { CourseInfo { "c", "C" } });
        if (result.failed())
            return result;
        if (store.canRedo() || store.redoDepth() != 0)
            return juce::Result::fail("a new commit must discard the redo branch");
        if (store.undoDepth() != 2)
            return juce::Result::fail("expected two undo entries after branching");

        return juce::Result::ok();
    }

    juce::Result testMemberRemovalCascade()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());
        const auto before = store.snapshot();

        const auto result = store.apply(RemoveMemberAction { "s1" });
        if (result.failed())
            return result;

        const auto& roster = rosterOf(store);
        if (Selectors::findMember(roster, "s1") != nullptr)
            return juce::Result::fail("member must be removed");

        for (const auto& group : roster.groups)
        {
            if (std::find(group.memberIds.begin(), group.memberIds.end(), "s1") != group.memberIds.end())
                return juce::Result::fail("member must be stripped from group " + group.id);
        }

        if (store.undoDepth() != 1)
            return juce::Result::fail("cascade must be a single history entry");

        store.undo();
        if (*store.snapshot() != *before)
            return juce::Result::fail("undo must restore member and memberships");

        return juce::Result::ok();
    }

    juce::Result testSharedGroupSetDeletion()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());
        const auto before = store.snapshot();

        const auto result = store.apply(DeleteGroupSetAction { "gs1" });
        if (result.failed())
            return result;

        const auto& roster = rosterOf(store);
        if (Selectors::findGroupSet(roster, "gs1") != nullptr)
            return juce::Result::fail("set must be removed");
        if (Selectors::findGroup(roster, "g1") != nullptr)
            return juce::Result::fail("group only referenced by the deleted set must be removed");
        if (Selectors::findGroup(roster, "g2") == nullptr)
            return juce::Result::fail("group still referenced by another set must survive");
        if (Selectors::findAssignment(roster, "a1")->groupSetId != "gs1")
            return juce::Result::fail("assignment keeps its dangling group set id");

        const auto validation = Gateway::RosterValidator::validateRoster(roster);
        if (!hasIssue(validation, ValidationKind::missingGroupSet, "a1"))
            return juce::Result::fail("dangling assignment must be reported");

        store.undo();
        if (*store.snapshot() != *before)
            return juce::Result::fail("undo must restore the set and its groups");

        return juce::Result::ok();
    }

    juce::Result testSystemSetMergeDedup()
    {
        Roster roster;
        roster.students = { makeMember("s1", "Alice Smith", "alice@example.com") };
        roster.groups = { makeGroup("ga", "alice_smith", { "s1" }, GroupOrigin::system),
                          makeGroup("gb", "alice_smith", { "s1" }, GroupOrigin::system) };
        roster.groupSets = {
            makeGroupSet("sysA", "Individual Students", { "ga" }, SystemConnection { SystemSetType::individualStudents }),
            makeGroupSet("st1", "Staff", {}, SystemConnection { SystemSetType::staff }),
            makeGroupSet("sysB", "Individual Students", { "gb" }, SystemConnection { SystemSetType::individualStudents }),
            makeGroupSet("st2", "Staff", {}, SystemConnection { SystemSetType::staff })
        };

        SystemGroupSetPatch patch;
        patch.groupSets = { makeGroupSet("sysB",
                                         "Individual Students",
                                         { "gb" },
                                         SystemConnection { SystemSetType::individualStudents }) };

        Core::SystemGroupSets::mergePatch(roster, patch);

        std::vector<GroupSetId> setIds;
        for (const auto& groupSet : roster.groupSets)
            setIds.push_back(groupSet.id);

        if (setIds != std::vector<GroupSetId> { "st1", "sysB" })
            return juce::Result::fail("expected one set per system type: st1 and sysB");
        if (Selectors::findGroup(roster, "ga") != nullptr)
            return juce::Result::fail("group of the dropped duplicate must be swept");
        if (Core::SystemGroupSets::systemSetsMissing(roster))
            return juce::Result::fail("both system sets must remain");

        if (Core::SystemGroupSets::dedupeSystemSets(roster))
            return juce::Result::fail("a deduplicated roster must be left alone");

        roster.groups.push_back(makeGroup("gc", "alice_smith", { "s1" }, GroupOrigin::system));
        roster.groupSets.push_back(
            makeGroupSet("sysC", "Individual Students", { "gc" }, SystemConnection { SystemSetType::individualStudents }));

        if (!Core::SystemGroupSets::dedupeSystemSets(roster))
            return juce::Result::fail("a second individual set must be dropped");
        if (Selectors::findGroupSet(roster, "sysC") != nullptr || Selectors::findGroup(roster, "gc") != nullptr)
            return juce::Result::fail("the later duplicate and its group must go");
        if (Selectors::findGroupSet(roster, "sysB") == nullptr)
            return juce::Result::fail("the first set of the type must stay");

        return juce::Result::ok();
    }

    juce::Result testUndoSurvivesSystemMerge()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());

        const auto result = store.apply(AddMemberAction { makeMember("s4", "Erin Black", "erin@example.com") });
        if (result.failed())
            return result;

        SystemGroupSetPatch patch;
        patch.groupsUpserted = { makeGroup("st-g1", "dana_teacher", { "t1" }, GroupOrigin::system) };
        patch.groupSets = { makeGroupSet("st", "Staff", { "st-g1" }, SystemConnection { SystemSetType::staff }) };

        auto merged = std::make_shared<ProfileDocument>(*store.snapshot());
        Core::SystemGroupSets::mergePatch(*merged->roster, patch);
        store.replaceWithoutHistory(std::move(merged));

        if (!store.undo().has_value())
            return juce::Result::fail("undo after a system merge must succeed");

        const auto& roster = rosterOf(store);
        if (Selectors::findMember(roster, "s4") != nullptr)
            return juce::Result::fail("undo must remove the added member");
        if (Selectors::findGroupSet(roster, "st") == nullptr || Selectors::findGroup(roster, "st-g1") == nullptr)
            return juce::Result::fail("system merge outside history must survive undo");

        return juce::Result::ok();
    }

    juce::Result testRosterImportUndoAfterSync()
    {
        SequentialIds ids;
        Core::DocumentStore store;
        store.reset(makeBaseDocument());
        synchronizeSystemSets(store, ids);

        if (const auto check = checkSystemSetInvariants(rosterOf(store), "initial sync"); check.failed())
            return check;

        const auto synced = rosterOf(store);

        Roster imported;
        imported.students = { makeMember("s1", "Alice Smith", "alice@example.com"),
                              makeMember("s5", "Frank Green", "frank@example.com") };
        imported.staff = synced.staff;
        imported.groups = { makeGroup("g9", "Team 9", { "s1", "s5" }) };
        imported.groupSets = { makeGroupSet("gs9", "Imported", { "g9" }) };

        if (const auto result = store.apply(SetRosterAction { imported, "Import roster" }); result.failed())
            return result;

        synchronizeSystemSets(store, ids);
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after import"); check.failed())
            return check;

        const auto undone = store.undo();
        if (!undone.has_value() || undone->description != "Import roster")
            return juce::Result::fail("import must be undoable");
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after undo"); check.failed())
            return check;
        if (!(rosterOf(store) == synced))
            return juce::Result::fail("undoing an import must restore the replaced roster exactly");

        if (!store.redo().has_value())
            return juce::Result::fail("import must be redoable");
        if (Selectors::findGroupSet(rosterOf(store), "gs9") == nullptr
            || Selectors::findGroupSet(rosterOf(store), "gs1") != nullptr)
            return juce::Result::fail("redo must reinstate the imported roster");

        synchronizeSystemSets(store, ids);
        return checkSystemSetInvariants(rosterOf(store), "after redo");
    }

    juce::Result testGroupSetDeletionUndoAfterSync()
    {
        SequentialIds ids;
        Core::DocumentStore store;
        store.reset(makeBaseDocument());
        synchronizeSystemSets(store, ids);

        if (const auto result = store.apply(DeleteGroupSetAction { "gs1" }); result.failed())
            return result;
        if (Selectors::findGroup(rosterOf(store), "g1") != nullptr)
            return juce::Result::fail("group only referenced by the deleted set must be swept");

        synchronizeSystemSets(store, ids);
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after delete"); check.failed())
            return check;

        if (!store.undo().has_value())
            return juce::Result::fail("deletion must be undoable");
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after undo"); check.failed())
            return check;

        const auto* restored = Selectors::findGroupSet(rosterOf(store), "gs1");
        if (restored == nullptr || restored->groupIds != std::vector<GroupId> { "g1", "g2" }
            || Selectors::findGroup(rosterOf(store), "g1") == nullptr)
            return juce::Result::fail("undo must restore the set and its swept group");

        if (!store.redo().has_value())
            return juce::Result::fail("deletion must be redoable");

        synchronizeSystemSets(store, ids);
        return checkSystemSetInvariants(rosterOf(store), "after redo");
    }

    juce::Result testMemberRemovalUndoAfterSync()
    {
        SequentialIds ids;
        Core::DocumentStore store;
        store.reset(makeBaseDocument());
        synchronizeSystemSets(store, ids);

        const auto singletonCount = [&store](const RosterMemberId& memberId)
        {
            return std::count_if(rosterOf(store).groups.begin(),
                                 rosterOf(store).groups.end(),
                                 [&memberId](const Group& group)
                                 {
                                     return group.origin == GroupOrigin::system
                                         && group.memberIds == std::vector<RosterMemberId> { memberId };
                                 });
        };

        if (const auto result = store.apply(RemoveMemberAction { "s3" }); result.failed())
            return result;

        synchronizeSystemSets(store, ids);
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after removal"); check.failed())
            return check;
        if (singletonCount("s3") != 0)
            return juce::Result::fail("removed member must lose their singleton group");

        if (!store.undo().has_value())
            return juce::Result::fail("removal must be undoable");

        synchronizeSystemSets(store, ids);
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after undo"); check.failed())
            return check;
        if (Selectors::findMember(rosterOf(store), "s3") == nullptr || singletonCount("s3") != 1)
            return juce::Result::fail("restored member must own exactly one singleton group");
        if (Selectors::findGroup(rosterOf(store), "g2")->memberIds != std::vector<RosterMemberId> { "s3" })
            return juce::Result::fail("undo must restore local memberships");

        if (!store.redo().has_value())
            return juce::Result::fail("removal must be redoable");

        synchronizeSystemSets(store, ids);
        if (const auto check = checkSystemSetInvariants(rosterOf(store), "after redo"); check.failed())
            return check;

        for (const auto& group : rosterOf(store).groups)
        {
            if (std::find(group.memberIds.begin(), group.memberIds.end(), "s3") != group.memberIds.end())
                return juce::Result::fail("no group may keep the removed member after redo");
        }

        return juce::Result::ok();
    }

    juce::Result testFailedHistoryStepDoesNotWedge()
    {
        CourseInfo course;
        course.id = "course-2";
        course.name = "Algorithms";

        const auto withoutRoster = [](const Core::DocumentPtr& document)
        {
            auto stripped = std::make_shared<ProfileDocument>(*document);
            stripped->roster.reset();
            return Core::DocumentPtr(std::move(stripped));
        };

        Core::DocumentStore store;
        store.reset(makeBaseDocument());
        if (store.apply(SetCourseAction { course }).failed()
            || store.apply(AddMemberAction { makeMember("s4", "Erin Black", "erin@example.com") }).failed())
            return juce::Result::fail("setup edits must commit");

        store.replaceWithoutHistory(withoutRoster(store.snapshot()));
        if (store.undo().has_value())
            return juce::Result::fail("member splice cannot be undone without a roster");
        if (store.canUndo() || store.canRedo())
            return juce::Result::fail("failed undo must clear the history");
        if (store.snapshot()->roster.has_value())
            return juce::Result::fail("failed undo must leave the document untouched");

        store.reset(makeBaseDocument());
        if (store.apply(SetCourseAction { course }).failed()
            || store.apply(AddMemberAction { makeMember("s4", "Erin Black", "erin@example.com") }).failed())
            return juce::Result::fail("setup edits must commit");
        if (!store.undo().has_value())
            return juce::Result::fail("member addition must be undoable");

        store.replaceWithoutHistory(withoutRoster(store.snapshot()));
        if (store.redo().has_value())
            return juce::Result::fail("member splice cannot be redone without a roster");
        if (store.canRedo() || store.undoDepth() != 1)
            return juce::Result::fail("failed redo must drop only the redo branch");
        if (!store.undo().has_value() || store.snapshot()->settings.course.name != "Data Structures")
            return juce::Result::fail("older entries must stay undoable after a failed redo");

        return juce::Result::ok();
    }

    juce::Result testMemberBasedGroupCreation()
    {
        Core::DocumentStore store;
        store.reset(makeBaseDocument());

        const auto firstName = Core::Reducer::nextNewGroupSetName(&rosterOf(store));
        if (firstName != "New Group Set")
            return juce::Result::fail("unexpected first set name: " + firstName);

        CreateGroupSetWithMemberAction create;
        create.memberId = "s1";
        create.sourceGroupId = GroupId("g1");
        create.transfer = MemberTransfer::move;
        create.groupSetId = "gs-new";
        create.groupId = "g-alice";
        create.groupSetName = firstName;
        if (const auto result = store.apply(create); result.failed())
            return result;

        const auto& roster = rosterOf(store);
        const auto* group = Selectors::findGroup(roster, "g-alice");
        if (group == nullptr || group->name != "Alice Smith" || group->origin != GroupOrigin::local)
            return juce::Result::fail("new group must be a local group named after the member");

        const auto& g1 = *Selectors::findGroup(roster, "g1");
        if (std::find(g1.memberIds.begin(), g1.memberIds.end(), "s1") != g1.memberIds.end())
            return juce::Result::fail("move must detach the member from the source group");
        if (!Selectors::isGroupSetEditable(roster, "gs-new"))
            return juce::Result::fail("member-created set must be user editable");

        if (Core::Reducer::nextNewGroupSetName(&roster) != "New Group Set (2)")
            return juce::Result::fail("second set name must be numbered");

        CreateGroupInSetWithMemberAction copyInto;
        copyInto.memberId = "s3";
        copyInto.groupSetId = "gs-new";
        copyInto.transfer = MemberTransfer::copy;
        copyInto.groupId = "g-carol";
        if (const auto result = store.apply(copyInto); result.failed())
            return result;

        if (Selectors::groupsOfSet(rosterOf(store), "gs-new").size() != 2)
            return juce::Result::fail("group must be appended to the set");
        if (Selectors::groupReferenceCount(rosterOf(store), "g2") != 2)
            return juce::Result::fail("copy must leave the source membership alone");

        copyInto.groupSetId = "sys";
        copyInto.groupId = "g-refused";
        if (store.apply(copyInto).wasOk())
            return juce::Result::fail("system sets must not accept member-created groups");

        return juce::Result::ok();
    }

    juce::Result testEmailRules()
    {
        using Gateway::RosterValidator::isValidEmail;

        if (!isValidEmail("a@b.co") || !isValidEmail("  first.last@uni.example.edu "))
            return juce::Result::fail("well-formed emails must pass");

        const char* invalid[] = { "a@b", "a b@c.de", "@c.de", "a@@c.de", "a@.cd", "a@cd.", "plain" };
        for (const auto* email : invalid)
        {
            if (isValidEmail(email))
                return juce::Result::fail(juce::String("email must be rejected: ") + email);
        }

        return juce::Result::ok();
    }

    juce::Result testRosterValidation()
    {
        Roster roster;
        roster.students = { makeMember("s1", "Alice", "alice@example.com"),
                            makeMember("s2", "Alice Two", "ALICE@example.com "),
                            makeMember("s3", "No Mail", ""),
                            makeMember("s4", "Bad Mail", "bob@example"),
                            makeMember("s5", "Observer", "obs@example.com", EnrollmentType::observer) };
        roster.staff = { makeMember("t1", "Teacher", "t@example.com", EnrollmentType::teacher),
                         makeMember("t2", "Student In Staff", "x@example.com") };
        roster.groups = { makeGroup("g1", "Team 1", { "s1", "ghost" }) };

        CanvasConnection canvas;
        canvas.courseId = "42";
        roster.groupSets = { makeGroupSet("gs1", "Projects", { "g1", "missing-group" }),
                             makeGroupSet("gs2", "Canvas", { "g1" }, canvas) };
        roster.assignments = { makeAssignment("a1", "Lab 1", "gs1"),
                               makeAssignment("a2", "lab  1", "gone") };

        const auto result = Gateway::RosterValidator::validateRoster(roster);

        struct Expectation
        {
            ValidationKind kind;
            const char* affectedId;
        };

        const Expectation expectations[] = {
            { ValidationKind::systemGroupSetsMissing, "" },
            { ValidationKind::duplicateEmail, "alice@example.com" },
            { ValidationKind::missingEmail, "s3" },
            { ValidationKind::invalidEmail, "s4" },
            { ValidationKind::duplicateAssignmentName, "lab 1" },
            { ValidationKind::orphanGroupMember, "ghost" },
            { ValidationKind::orphanGroupMember, "missing-group" },
            { ValidationKind::invalidEnrollmentPartition, "s5" },
            { ValidationKind::invalidEnrollmentPartition, "t2" },
            { ValidationKind::invalidGroupOrigin, "g1" },
            { ValidationKind::missingGroupSet, "a2" },
        };

        for (const auto& expected : expectations)
        {
            if (!hasIssue(result, expected.kind, expected.affectedId))
                return juce::Result::fail("missing issue " + validationKindToKey(expected.kind) + " for '"
                                          + expected.affectedId + "'");
        }

        if (hasIssue(result, ValidationKind::duplicateStudentId))
            return juce::Result::fail("no duplicate member ids in this roster");
        if (!hasBlockingIssues(result))
            return juce::Result::fail("roster must have blocking issues");

        return juce::Result::ok();
    }

    juce::Result testAssignmentValidation()
    {
        Roster roster;
        auto alice = makeMember("s1", "Alice", "a@example.com");
        alice.gitUsername = juce::String("alice");
        auto bob = makeMember("s2", "Bob", "b@example.com");
        auto carol = makeMember("s3", "Carol", "c@example.com");
        carol.gitUsername = juce::String("carol");
        carol.gitUsernameStatus = GitUsernameStatus::invalid;
        auto dropped = makeMember("s5", "Dropped", "d@example.com");
        dropped.status = MemberStatus::dropped;

        roster.students = { alice, bob, carol, makeMember("s4", "Unassigned", "u@example.com"), dropped };
        roster.groups = { makeGroup("g1", "Team A", { "s1", "s2", "s5" }),
                          makeGroup("g2", "team  a", { "s2", "s3" }),
                          makeGroup("g3", "Team C", {}) };
        roster.groupSets = { makeGroupSet("gs1", "Projects", { "g1", "g2", "g3" }) };

        auto selective = makeAssignment("a2", "Only C", "gs1");
        selective.assignmentType = AssignmentType::selective;
        selective.groupSelection.kind = GroupSelectionMode::Kind::pattern;
        selective.groupSelection.pattern = "team c";
        roster.assignments = { makeAssignment("a1", "Lab 1", "gs1"), selective };

        const auto byUsername = Gateway::RosterValidator::validateAssignment(roster, "a1", GitIdentityMode::username);
        if (!hasIssue(byUsername, ValidationKind::duplicateGroupNameInAssignment, "team a"))
            return juce::Result::fail("duplicate normalized group names must be reported");
        if (!hasIssue(byUsername, ValidationKind::studentInMultipleGroupsInAssignment, "s2"))
            return juce::Result::fail("s2 is in two groups");
        if (!hasIssue(byUsername, ValidationKind::emptyGroup, "g3"))
            return juce::Result::fail("g3 is empty");
        if (!hasIssue(byUsername, ValidationKind::missingGitUsername, "s2"))
            return juce::Result::fail("s2 has no git username");
        if (!hasIssue(byUsername, ValidationKind::invalidGitUsername, "s3"))
            return juce::Result::fail("s3 has an invalid git username");
        if (!hasIssue(byUsername, ValidationKind::studentMissingFromAssignment, "s4"))
            return juce::Result::fail("s4 is not in any group");
        if (hasIssue(byUsername, ValidationKind::studentMissingFromAssignment, "s5"))
            return juce::Result::fail("dropped students are never reported as unassigned");

        const auto byEmail = Gateway::RosterValidator::validateAssignment(roster, "a1", GitIdentityMode::email);
        if (hasIssue(byEmail, ValidationKind::missingGitUsername) || hasIssue(byEmail, ValidationKind::invalidGitUsername))
            return juce::Result::fail("git usernames are only checked in username mode");

        const auto patterned = Gateway::RosterValidator::validateAssignment(roster, "a2", GitIdentityMode::username);
        if (patterned.issues.size() != 1 || !hasIssue(patterned, ValidationKind::emptyGroup, "g3"))
            return juce::Result::fail("pattern selection must only see Team C");

        const auto unknown = Gateway::RosterValidator::validateAssignment(roster, "nope", GitIdentityMode::username);
        if (!unknown.isClean())
            return juce::Result::fail("unknown assignment yields no issues");

        return juce::Result::ok();
    }

    juce::Result testSystemGroupSetBuilder()
    {
        Roster roster;
        auto droppedStudent = makeMember("dd00-0003", "Zed Dropped", "z@example.com");
        droppedStudent.status = MemberStatus::dropped;
        roster.students = { makeMember("a1b2-0001", "Alice Smith", "a@example.com"),
                            makeMember("ffee-0002", "Alice  Smith", "a2@example.com"),
                            droppedStudent };
        roster.staff = { makeMember("t1", "Dana Teacher", "d@example.com", EnrollmentType::teacher) };
        roster.groups = { makeGroup("old", "zed_dropped", { "dd00-0003" }, GroupOrigin::system),
                          makeGroup("g1", "Team 1", { "a1b2-0001", "dd00-0003" }) };
        roster.groupSets = { makeGroupSet("sys", "Individual Students", { "old" },
                                          SystemConnection { SystemSetType::individualStudents }),
                             makeGroupSet("gs1", "Projects", { "g1" }) };

        SequentialIds ids;
        const auto patch = Gateway::SystemGroupSetBuilder::buildPatch(roster, ids);

        if (patch.groupSets.size() != 2)
            return juce::Result::fail("patch must describe both system sets");
        if (patch.deletedGroupIds != std::vector<GroupId> { "old" })
            return juce::Result::fail("group of the dropped student must be deleted");

        std::vector<juce::String> upsertedNames;
        for (const auto& group : patch.groupsUpserted)
            upsertedNames.push_back(group.name);

        for (const auto* expected : { "alice_smith", "alice_smith_ffee", "dana_teacher", "Team 1" })
        {
            if (std::find(upsertedNames.begin(), upsertedNames.end(), expected) == upsertedNames.end())
                return juce::Result::fail(juce::String("missing upserted group ") + expected);
        }

        Core::SystemGroupSets::mergePatch(roster, patch);
        if (Core::SystemGroupSets::systemSetsMissing(roster))
            return juce::Result::fail("system sets must exist after merge");
        if (Selectors::findGroup(roster, "g1")->memberIds != std::vector<RosterMemberId> { "a1b2-0001" })
            return juce::Result::fail("inactive members must be stripped from local groups");

        const auto* individual = Selectors::systemSet(roster, SystemSetType::individualStudents);
        if (individual == nullptr || individual->id != "sys" || individual->groupIds.size() != 2)
            return juce::Result::fail("existing individual set must be kept and hold one group per active student");

        const auto second = Gateway::SystemGroupSetBuilder::buildPatch(roster, ids);
        if (!second.groupsUpserted.empty() || !second.deletedGroupIds.empty())
            return juce::Result::fail("a synchronized roster must yield no group changes");

        const auto validation = Gateway::RosterValidator::validateRoster(roster);
        if (hasIssue(validation, ValidationKind::systemGroupSetsMissing) || hasIssue(validation, ValidationKind::invalidGroupOrigin))
            return juce::Result::fail("synchronized roster must pass system checks");

        return juce::Result::ok();
    }

    juce::Result testJsonRoundTrip()
    {
        auto roster = *makeBaseDocument()->roster;

        RosterConnection connection;
        connection.kind = RosterConnection::Kind::canvas;
        connection.courseId = "4711";
        connection.lastUpdated = "2026-01-05T10:00:00Z";
        roster.connection = connection;

        roster.students[0].gitUsername = juce::String("alice-gh");
        roster.students[0].gitUsernameStatus = GitUsernameStatus::valid;
        roster.students[0].studentNumber = juce::String("S-001");
        roster.students[1].status = MemberStatus::incomplete;
        roster.students[1].lmsUserId = juce::String("991");

        ImportConnection imported;
        imported.sourceFilename = "groups.csv";
        imported.lastUpdated = "2026-01-06";
        MoodleConnection moodle;
        moodle.courseId = "7";
        moodle.groupingId = "12";
        CanvasConnection canvas;
        canvas.courseId = "4711";
        canvas.groupSetId = "88";

        auto lmsGroup = makeGroup("lg1", "Canvas Team", { "s3" }, GroupOrigin::lms);
        lmsGroup.lmsGroupId = juce::String("c-55");
        roster.groups.push_back(lmsGroup);
        roster.groupSets.push_back(makeGroupSet("imp", "Imported", { "g2" }, imported));
        roster.groupSets.push_back(makeGroupSet("moo", "Moodle", {}, moodle));
        roster.groupSets.push_back(makeGroupSet("can", "Canvas", { "lg1" }, canvas));

        auto selective = makeAssignment("a2", "Final", "gs1");
        selective.description = juce::String("Capstone");
        selective.assignmentType = AssignmentType::selective;
        selective.groupSelection.kind = GroupSelectionMode::Kind::pattern;
        selective.groupSelection.pattern = "Team*";
        selective.groupSelection.excludedGroupIds = { "g2" };
        roster.assignments.push_back(selective);

        juce::String json;
        if (const auto result = Serialization::serializeRosterToJsonString(roster, json); result.failed())
            return result;

        Roster parsed;
        juce::StringArray warnings;
        if (const auto result = Serialization::parseRosterFromJsonString(json, parsed, warnings); result.failed())
            return juce::Result::fail("roster parse failed: " + result.getErrorMessage());
        if (!(parsed == roster) || !warnings.isEmpty())
            return juce::Result::fail("roster must survive a JSON round trip");

        ProfileSettings settings;
        settings.course = { "course-1", "Data Structures" };
        settings.courseVerifiedAt = juce::String("2026-01-01T00:00:00Z");
        settings.gitConnection = juce::String("school-gitlab");
        settings.operations.targetOrg = "ds-2026";
        settings.operations.clone.directoryLayout = DirectoryLayout::byTeam;
        settings.exports.outputCsv = true;
        settings.exports.includeInitials = true;

        if (const auto result = Serialization::serializeSettingsToJsonString(settings, json); result.failed())
            return result;

        ProfileSettings parsedSettings;
        if (const auto result = Serialization::parseSettingsFromJsonString(json, parsedSettings, warnings); result.failed())
            return juce::Result::fail("settings parse failed: " + result.getErrorMessage());
        if (!(parsedSettings == settings))
            return juce::Result::fail("settings must survive a JSON round trip");

        return juce::Result::ok();
    }

    juce::Result testJsonLenientAndStrictParsing()
    {
        Roster roster;
        juce::StringArray warnings;
        const auto lenient = Serialization::parseRosterFromJsonString(
            R"({"students":[{"id":"s1","name":"Alice","status":"on_leave","enrollment_type":"student"}]})",
            roster,
            warnings);

        if (lenient.failed())
            return juce::Result::fail("unknown enum keys must not fail parsing: " + lenient.getErrorMessage());
        if (warnings.size() != 1 || roster.students.size() != 1 || roster.students.front().status != MemberStatus::active)
            return juce::Result::fail("unknown member status must fall back to active with a warning");

        const auto missingId = Serialization::parseRosterFromJsonString(R"({"groups":[{"name":"x"}]})", roster, warnings);
        if (missingId.wasOk() || !missingId.getErrorMessage().contains("group requires id"))
            return juce::Result::fail("group without id must be rejected");

        if (Serialization::parseRosterFromJsonString("{ not json", roster, warnings).wasOk())
            return juce::Result::fail("malformed JSON must be rejected");

        ProfileSettings settings;
        settings.gitConnection = juce::String("stale");
        const auto nullable = Serialization::parseSettingsFromJsonString(R"({"git_connection":null,"exports":{"output_csv":true}})",
                                                                         settings,
                                                                         warnings);
        if (nullable.failed() || settings.gitConnection.has_value() || !settings.exports.outputCsv || !settings.exports.outputYaml)
            return juce::Result::fail("null clears optional fields and missing fields keep defaults");

        const auto wrongType = Serialization::parseSettingsFromJsonString(R"({"exports":{"output_csv":"yes"}})", settings, warnings);
        if (wrongType.wasOk() || !wrongType.getErrorMessage().contains("exports.output_csv must be bool"))
            return juce::Result::fail("type errors must name the offending field");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Read-only guards and idempotent rename", testReadOnlyGuardsAndIdempotentRename },
        { "Undo/Redo round trip", testUndoRedoRoundTrip },
        { "History bound 150 -> 100", testHistoryBound },
        { "Branch discard", testBranchDiscard },
        { "Member removal cascade", testMemberRemovalCascade },
        { "Shared group set deletion", testSharedGroupSetDeletion },
        { "System set merge dedup", testSystemSetMergeDedup },
        { "Undo survives system merge", testUndoSurvivesSystemMerge },
        { "Roster import undo after sync", testRosterImportUndoAfterSync },
        { "Group set deletion undo after sync", testGroupSetDeletionUndoAfterSync },
        { "Member removal undo after sync", testMemberRemovalUndoAfterSync },
        { "Failed history step does not wedge", testFailedHistoryStepDoesNotWedge },
        { "Member-based group creation", testMemberBasedGroupCreation },
        { "Email rules", testEmailRules },
        { "Roster validation", testRosterValidation },
        { "Assignment validation", testAssignmentValidation },
        { "System group set builder", testSystemGroupSetBuilder },
        { "JSON round trip", testJsonRoundTrip },
        { "JSON lenient/strict parsing", testJsonLenientAndStrictParsing }
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

    std::cout << "Classbook core smoke passed." << std::endl;
    return 0;
}
