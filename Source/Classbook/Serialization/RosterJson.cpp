#include "Classbook/Serialization/RosterJson.h"

namespace
{
    using namespace Classbook;

    juce::var makeStringArray(const std::vector<juce::String>& values)
    {
        juce::Array<juce::var> array;
        for (const auto& value : values)
            array.add(value);

        return juce::var(array);
    }

    void setOptionalString(juce::DynamicObject& object, const juce::Identifier& key, const std::optional<juce::String>& value)
    {
        if (value.has_value())
            object.setProperty(key, *value);
    }

    juce::Result requireObject(const juce::var& value, const juce::String& context, const juce::NamedValueSet*& propsOut)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail(context + " must be object");

        propsOut = &object->getProperties();
        return juce::Result::ok();
    }

    juce::Result parseRequiredString(const juce::NamedValueSet& props,
                                     const juce::Identifier& key,
                                     const juce::String& context,
                                     juce::String& outValue)
    {
        if (!props.contains(key))
            return juce::Result::fail(context + " requires " + key.toString());

        const auto& value = props[key];
        if (!value.isString())
            return juce::Result::fail(context + "." + key.toString() + " must be string");

        outValue = value.toString();
        return juce::Result::ok();
    }

    juce::Result parseOptionalStringProperty(const juce::NamedValueSet& props,
                                             const juce::Identifier& key,
                                             const juce::String& context,
                                             juce::String& outValue)
    {
        if (!props.contains(key) || props[key].isVoid())
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isString())
            return juce::Result::fail(context + "." + key.toString() + " must be string");

        outValue = value.toString();
        return juce::Result::ok();
    }

    juce::Result parseNullableString(const juce::NamedValueSet& props,
                                     const juce::Identifier& key,
                                     const juce::String& context,
                                     std::optional<juce::String>& outValue)
    {
        outValue.reset();
        if (!props.contains(key) || props[key].isVoid())
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isString())
            return juce::Result::fail(context + "." + key.toString() + " must be string or null");

        outValue = value.toString();
        return juce::Result::ok();
    }

    juce::Result parseOptionalBoolProperty(const juce::NamedValueSet& props,
                                           const juce::Identifier& key,
                                           const juce::String& context,
                                           bool& outValue)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isBool())
            return juce::Result::fail(context + "." + key.toString() + " must be bool");

        outValue = static_cast<bool>(value);
        return juce::Result::ok();
    }

    juce::Result parseStringArray(const juce::NamedValueSet& props,
                                  const juce::Identifier& key,
                                  const juce::String& context,
                                  std::vector<juce::String>& outValues)
    {
        outValues.clear();
        if (!props.contains(key))
            return juce::Result::ok();

        const auto* array = props[key].getArray();
        if (array == nullptr)
            return juce::Result::fail(context + "." + key.toString() + " must be array");

        outValues.reserve(static_cast<size_t>(array->size()));
        for (const auto& item : *array)
        {
            if (!item.isString())
                return juce::Result::fail(context + "." + key.toString() + " must contain strings");

            outValues.push_back(item.toString());
        }

        return juce::Result::ok();
    }

    // Unknown keys fall back to the default and leave a warning behind.
    template <typename Enum, typename Parser>
    Enum parseEnumProperty(const juce::NamedValueSet& props,
                           const juce::Identifier& key,
                           const juce::String& context,
                           Parser parser,
                           Enum fallback,
                           juce::StringArray& warnings)
    {
        if (!props.contains(key))
            return fallback;

        const auto text = props[key].toString();
        if (const auto parsed = parser(text))
            return *parsed;

        warnings.add(context + "." + key.toString() + " has unknown value '" + text + "'");
        return fallback;
    }

    // ---------------------------------------------------------------------------------
    //  Settings
    // ---------------------------------------------------------------------------------

    juce::var serializeOperations(const OperationConfigs& operations)
    {
        auto create = std::make_unique<juce::DynamicObject>();
        create->setProperty("template_org", operations.create.templateOrg);

        auto clone = std::make_unique<juce::DynamicObject>();
        clone->setProperty("target_dir", operations.clone.targetDir);
        clone->setProperty("directory_layout", directoryLayoutToKey(operations.clone.directoryLayout));

        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("target_org", operations.targetOrg);
        object->setProperty("repo_name_template", operations.repoNameTemplate);
        object->setProperty("create", juce::var(create.release()));
        object->setProperty("clone", juce::var(clone.release()));
        object->setProperty("delete", juce::var(new juce::DynamicObject()));
        return juce::var(object.release());
    }

    juce::Result parseOperations(const juce::var& value, OperationConfigs& outOperations, juce::StringArray& warnings)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "operations", props); result.failed())
            return result;

        if (const auto result = parseOptionalStringProperty(*props, "target_org", "operations", outOperations.targetOrg);
            result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(*props, "repo_name_template", "operations", outOperations.repoNameTemplate);
            result.failed())
            return result;

        if (props->contains("create"))
        {
            const juce::NamedValueSet* createProps = nullptr;
            if (const auto result = requireObject((*props)["create"], "operations.create", createProps); result.failed())
                return result;
            if (const auto result = parseOptionalStringProperty(*createProps, "template_org", "operations.create", outOperations.create.templateOrg);
                result.failed())
                return result;
        }

        if (props->contains("clone"))
        {
            const juce::NamedValueSet* cloneProps = nullptr;
            if (const auto result = requireObject((*props)["clone"], "operations.clone", cloneProps); result.failed())
                return result;
            if (const auto result = parseOptionalStringProperty(*cloneProps, "target_dir", "operations.clone", outOperations.clone.targetDir);
                result.failed())
                return result;

            outOperations.clone.directoryLayout = parseEnumProperty(*cloneProps,
                                                                    "directory_layout",
                                                                    "operations.clone",
                                                                    directoryLayoutFromKey,
                                                                    DirectoryLayout::flat,
                                                                    warnings);
        }

        return juce::Result::ok();
    }

    juce::var serializeExports(const ExportSettings& exports)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("output_folder", exports.outputFolder);
        object->setProperty("output_csv", exports.outputCsv);
        object->setProperty("output_xlsx", exports.outputXlsx);
        object->setProperty("output_yaml", exports.outputYaml);
        object->setProperty("csv_file", exports.csvFile);
        object->setProperty("xlsx_file", exports.xlsxFile);
        object->setProperty("yaml_file", exports.yamlFile);
        object->setProperty("member_option", exports.memberOption);
        object->setProperty("include_group", exports.includeGroup);
        object->setProperty("include_member", exports.includeMember);
        object->setProperty("include_initials", exports.includeInitials);
        object->setProperty("full_groups", exports.fullGroups);
        return juce::var(object.release());
    }

    juce::Result parseExports(const juce::var& value, ExportSettings& outExports)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "exports", props); result.failed())
            return result;

        const std::pair<const char*, juce::String*> stringFields[] = {
            { "output_folder", &outExports.outputFolder },
            { "csv_file", &outExports.csvFile },
            { "xlsx_file", &outExports.xlsxFile },
            { "yaml_file", &outExports.yamlFile },
            { "member_option", &outExports.memberOption },
        };

        for (const auto& [key, field] : stringFields)
        {
            if (const auto result = parseOptionalStringProperty(*props, key, "exports", *field); result.failed())
                return result;
        }

        const std::pair<const char*, bool*> boolFields[] = {
            { "output_csv", &outExports.outputCsv },
            { "output_xlsx", &outExports.outputXlsx },
            { "output_yaml", &outExports.outputYaml },
            { "include_group", &outExports.includeGroup },
            { "include_member", &outExports.includeMember },
            { "include_initials", &outExports.includeInitials },
            { "full_groups", &outExports.fullGroups },
        };

        for (const auto& [key, field] : boolFields)
        {
            if (const auto result = parseOptionalBoolProperty(*props, key, "exports", *field); result.failed())
                return result;
        }

        return juce::Result::ok();
    }

    // ---------------------------------------------------------------------------------
    //  Roster
    // ---------------------------------------------------------------------------------

    juce::var serializeMember(const RosterMember& member)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", member.id);
        object->setProperty("name", member.name);
        object->setProperty("email", member.email);
        setOptionalString(*object, "student_number", member.studentNumber);
        setOptionalString(*object, "git_username", member.gitUsername);
        object->setProperty("git_username_status", gitUsernameStatusToKey(member.gitUsernameStatus));
        object->setProperty("status", memberStatusToKey(member.status));
        setOptionalString(*object, "lms_user_id", member.lmsUserId);
        object->setProperty("enrollment_type", enrollmentTypeToKey(member.enrollmentType));
        setOptionalString(*object, "enrollment_display", member.enrollmentDisplay);
        object->setProperty("source", member.source);
        return juce::var(object.release());
    }

    juce::Result parseMember(const juce::var& value, RosterMember& outMember, juce::StringArray& warnings)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "member", props); result.failed())
            return result;

        if (const auto result = parseRequiredString(*props, "id", "member", outMember.id); result.failed())
            return result;
        if (outMember.id.isEmpty())
            return juce::Result::fail("member.id must not be empty");

        const auto context = "member " + outMember.id;
        if (const auto result = parseOptionalStringProperty(*props, "name", context, outMember.name); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(*props, "email", context, outMember.email); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "student_number", context, outMember.studentNumber); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "git_username", context, outMember.gitUsername); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "lms_user_id", context, outMember.lmsUserId); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "enrollment_display", context, outMember.enrollmentDisplay); result.failed())
            return result;
        if (const auto result = parseOptionalStringProperty(*props, "source", context, outMember.source); result.failed())
            return result;

        outMember.gitUsernameStatus = parseEnumProperty(*props,
                                                        "git_username_status",
                                                        context,
                                                        gitUsernameStatusFromKey,
                                                        GitUsernameStatus::unknown,
                                                        warnings);
        outMember.status = parseEnumProperty(*props, "status", context, memberStatusFromKey, MemberStatus::active, warnings);
        outMember.enrollmentType = parseEnumProperty(*props,
                                                     "enrollment_type",
                                                     context,
                                                     enrollmentTypeFromKey,
                                                     EnrollmentType::student,
                                                     warnings);
        return juce::Result::ok();
    }

    juce::var serializeGroup(const Group& group)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", group.id);
        object->setProperty("name", group.name);
        object->setProperty("member_ids", makeStringArray(group.memberIds));
        object->setProperty("origin", groupOriginToKey(group.origin));
        setOptionalString(*object, "lms_group_id", group.lmsGroupId);
        return juce::var(object.release());
    }

    juce::Result parseGroup(const juce::var& value, Group& outGroup, juce::StringArray& warnings)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "group", props); result.failed())
            return result;

        if (const auto result = parseRequiredString(*props, "id", "group", outGroup.id); result.failed())
            return result;
        if (outGroup.id.isEmpty())
            return juce::Result::fail("group.id must not be empty");

        const auto context = "group " + outGroup.id;
        if (const auto result = parseOptionalStringProperty(*props, "name", context, outGroup.name); result.failed())
            return result;
        if (const auto result = parseStringArray(*props, "member_ids", context, outGroup.memberIds); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "lms_group_id", context, outGroup.lmsGroupId); result.failed())
            return result;

        outGroup.origin = parseEnumProperty(*props, "origin", context, groupOriginFromKey, GroupOrigin::local, warnings);
        return juce::Result::ok();
    }

    juce::var serializeConnection(const GroupSetConnection& connection)
    {
        return std::visit([](const auto& typed) -> juce::var
                          {
                              using T = std::decay_t<decltype(typed)>;
                              if constexpr (std::is_same_v<T, LocalConnection>)
                              {
                                  return juce::var();
                              }
                              else
                              {
                                  auto object = std::make_unique<juce::DynamicObject>();
                                  if constexpr (std::is_same_v<T, ImportConnection>)
                                  {
                                      object->setProperty("kind", "import");
                                      object->setProperty("source_filename", typed.sourceFilename);
                                      object->setProperty("last_updated", typed.lastUpdated);
                                  }
                                  else if constexpr (std::is_same_v<T, CanvasConnection>)
                                  {
                                      object->setProperty("kind", "canvas");
                                      object->setProperty("course_id", typed.courseId);
                                      object->setProperty("group_set_id", typed.groupSetId);
                                      object->setProperty("last_updated", typed.lastUpdated);
                                  }
                                  else if constexpr (std::is_same_v<T, MoodleConnection>)
                                  {
                                      object->setProperty("kind", "moodle");
                                      object->setProperty("course_id", typed.courseId);
                                      object->setProperty("grouping_id", typed.groupingId);
                                      object->setProperty("last_updated", typed.lastUpdated);
                                  }
                                  else if constexpr (std::is_same_v<T, SystemConnection>)
                                  {
                                      object->setProperty("kind", "system");
                                      object->setProperty("system_type", systemSetTypeToKey(typed.systemType));
                                  }
                                  else
                                  {
                                      static_assert(kAlwaysFalse<T>, "unhandled group set connection");
                                  }

                                  return juce::var(object.release());
                              }
                          },
                          connection);
    }

    juce::Result parseConnection(const juce::var& value, const juce::String& context, GroupSetConnection& outConnection)
    {
        if (value.isVoid())
        {
            outConnection = LocalConnection {};
            return juce::Result::ok();
        }

        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, context, props); result.failed())
            return result;

        const auto kind = (*props)["kind"].toString().trim();
        if (kind == "system")
        {
            const auto systemType = systemSetTypeFromKey((*props)["system_type"].toString());
            if (!systemType.has_value())
                return juce::Result::fail(context + ".system_type is unknown: " + (*props)["system_type"].toString());

            outConnection = SystemConnection { *systemType };
            return juce::Result::ok();
        }

        if (kind == "canvas")
        {
            CanvasConnection canvas;
            canvas.courseId = (*props)["course_id"].toString();
            canvas.groupSetId = (*props)["group_set_id"].toString();
            canvas.lastUpdated = (*props)["last_updated"].toString();
            outConnection = canvas;
            return juce::Result::ok();
        }

        if (kind == "moodle")
        {
            MoodleConnection moodle;
            moodle.courseId = (*props)["course_id"].toString();
            moodle.groupingId = (*props)["grouping_id"].toString();
            moodle.lastUpdated = (*props)["last_updated"].toString();
            outConnection = moodle;
            return juce::Result::ok();
        }

        if (kind == "import")
        {
            ImportConnection imported;
            imported.sourceFilename = (*props)["source_filename"].toString();
            imported.lastUpdated = (*props)["last_updated"].toString();
            outConnection = imported;
            return juce::Result::ok();
        }

        return juce::Result::fail(context + ".kind is unknown: " + kind);
    }

    juce::var serializeGroupSet(const GroupSet& groupSet)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", groupSet.id);
        object->setProperty("name", groupSet.name);
        object->setProperty("group_ids", makeStringArray(groupSet.groupIds));
        object->setProperty("connection", serializeConnection(groupSet.connection));
        return juce::var(object.release());
    }

    juce::Result parseGroupSet(const juce::var& value, GroupSet& outGroupSet)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "group_set", props); result.failed())
            return result;

        if (const auto result = parseRequiredString(*props, "id", "group_set", outGroupSet.id); result.failed())
            return result;
        if (outGroupSet.id.isEmpty())
            return juce::Result::fail("group_set.id must not be empty");

        const auto context = "group_set " + outGroupSet.id;
        if (const auto result = parseOptionalStringProperty(*props, "name", context, outGroupSet.name); result.failed())
            return result;
        if (const auto result = parseStringArray(*props, "group_ids", context, outGroupSet.groupIds); result.failed())
            return result;

        return parseConnection((*props)["connection"], context + ".connection", outGroupSet.connection);
    }

    juce::var serializeAssignment(const Assignment& assignment)
    {
        auto selection = std::make_unique<juce::DynamicObject>();
        if (assignment.groupSelection.kind == GroupSelectionMode::Kind::pattern)
        {
            selection->setProperty("kind", "pattern");
            selection->setProperty("pattern", assignment.groupSelection.pattern);
        }
        else
        {
            selection->setProperty("kind", "all");
        }
        selection->setProperty("excluded_group_ids", makeStringArray(assignment.groupSelection.excludedGroupIds));

        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", assignment.id);
        object->setProperty("name", assignment.name);
        setOptionalString(*object, "description", assignment.description);
        object->setProperty("assignment_type", assignmentTypeToKey(assignment.assignmentType));
        object->setProperty("group_set_id", assignment.groupSetId);
        object->setProperty("group_selection", juce::var(selection.release()));
        return juce::var(object.release());
    }

    juce::Result parseAssignment(const juce::var& value, Assignment& outAssignment, juce::StringArray& warnings)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "assignment", props); result.failed())
            return result;

        if (const auto result = parseRequiredString(*props, "id", "assignment", outAssignment.id); result.failed())
            return result;
        if (outAssignment.id.isEmpty())
            return juce::Result::fail("assignment.id must not be empty");

        const auto context = "assignment " + outAssignment.id;
        if (const auto result = parseOptionalStringProperty(*props, "name", context, outAssignment.name); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "description", context, outAssignment.description); result.failed())
            return result;
        if (const auto result = parseRequiredString(*props, "group_set_id", context, outAssignment.groupSetId); result.failed())
            return result;

        outAssignment.assignmentType = parseEnumProperty(*props,
                                                         "assignment_type",
                                                         context,
                                                         assignmentTypeFromKey,
                                                         AssignmentType::classWide,
                                                         warnings);

        outAssignment.groupSelection = {};
        if (props->contains("group_selection"))
        {
            const juce::NamedValueSet* selectionProps = nullptr;
            const auto selectionContext = context + ".group_selection";
            if (const auto result = requireObject((*props)["group_selection"], selectionContext, selectionProps); result.failed())
                return result;

            auto& selection = outAssignment.groupSelection;
            const auto kind = (*selectionProps)["kind"].toString().trim();
            if (kind == "pattern")
            {
                selection.kind = GroupSelectionMode::Kind::pattern;
                if (const auto result = parseOptionalStringProperty(*selectionProps, "pattern", selectionContext, selection.pattern);
                    result.failed())
                    return result;
            }
            else if (kind != "all")
            {
                warnings.add(selectionContext + ".kind has unknown value '" + kind + "'");
            }

            if (const auto result = parseStringArray(*selectionProps, "excluded_group_ids", selectionContext, selection.excludedGroupIds);
                result.failed())
                return result;
        }

        return juce::Result::ok();
    }

    juce::var serializeRosterConnection(const RosterConnection& connection)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        switch (connection.kind)
        {
            case RosterConnection::Kind::canvas:
                object->setProperty("kind", "canvas");
                object->setProperty("course_id", connection.courseId);
                break;
            case RosterConnection::Kind::moodle:
                object->setProperty("kind", "moodle");
                object->setProperty("course_id", connection.courseId);
                break;
            case RosterConnection::Kind::import:
                object->setProperty("kind", "import");
                object->setProperty("source_filename", connection.sourceFilename);
                break;
        }

        object->setProperty("last_updated", connection.lastUpdated);
        return juce::var(object.release());
    }

    juce::Result parseRosterConnection(const juce::var& value, std::optional<RosterConnection>& outConnection)
    {
        outConnection.reset();
        if (value.isVoid())
            return juce::Result::ok();

        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "roster.connection", props); result.failed())
            return result;

        RosterConnection connection;
        const auto kind = (*props)["kind"].toString().trim();
        if (kind == "canvas")
            connection.kind = RosterConnection::Kind::canvas;
        else if (kind == "moodle")
            connection.kind = RosterConnection::Kind::moodle;
        else if (kind == "import")
            connection.kind = RosterConnection::Kind::import;
        else
            return juce::Result::fail("roster.connection.kind is unknown: " + kind);

        connection.courseId = (*props)["course_id"].toString();
        connection.sourceFilename = (*props)["source_filename"].toString();
        connection.lastUpdated = (*props)["last_updated"].toString();
        outConnection = connection;
        return juce::Result::ok();
    }

    template <typename Item, typename Parser>
    juce::Result parseItemArray(const juce::NamedValueSet& props,
                                const juce::Identifier& key,
                                std::vector<Item>& outItems,
                                Parser parser)
    {
        outItems.clear();
        if (!props.contains(key))
            return juce::Result::ok();

        const auto* array = props[key].getArray();
        if (array == nullptr)
            return juce::Result::fail("roster." + key.toString() + " must be array when present");

        outItems.reserve(static_cast<size_t>(array->size()));
        for (const auto& itemValue : *array)
        {
            Item item;
            const auto result = parser(itemValue, item);
            if (result.failed())
                return result;

            outItems.push_back(std::move(item));
        }

        return juce::Result::ok();
    }

    juce::Result parseJsonRoot(const juce::String& json, juce::var& rootOut)
    {
        const auto parseResult = juce::JSON::parse(json, rootOut);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        return juce::Result::ok();
    }

    juce::Result readJsonFile(const juce::File& file, juce::String& textOut)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("File not found: " + file.getFullPathName());

        textOut = file.loadFileAsString();
        return juce::Result::ok();
    }

    juce::Result writeJsonFile(const juce::File& file, const juce::String& json)
    {
        if (const auto result = file.getParentDirectory().createDirectory(); result.failed())
            return result;

        if (!file.replaceWithText(json))
            return juce::Result::fail("Failed to write JSON file: " + file.getFullPathName());

        return juce::Result::ok();
    }
}

namespace Classbook::Serialization
{
    juce::var settingsToVar(const ProfileSettings& settings)
    {
        auto course = std::make_unique<juce::DynamicObject>();
        course->setProperty("id", settings.course.id);
        course->setProperty("name", settings.course.name);

        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("course", juce::var(course.release()));
        setOptionalString(*root, "course_verified_at", settings.courseVerifiedAt);
        setOptionalString(*root, "git_connection", settings.gitConnection);
        root->setProperty("operations", serializeOperations(settings.operations));
        root->setProperty("exports", serializeExports(settings.exports));
        return juce::var(root.release());
    }

    juce::Result settingsFromVar(const juce::var& value, ProfileSettings& settingsOut, juce::StringArray& warningsOut)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "settings", props); result.failed())
            return result;

        ProfileSettings next = makeDefaultProfileSettings();

        if (props->contains("course"))
        {
            const juce::NamedValueSet* courseProps = nullptr;
            if (const auto result = requireObject((*props)["course"], "settings.course", courseProps); result.failed())
                return result;
            if (const auto result = parseOptionalStringProperty(*courseProps, "id", "settings.course", next.course.id); result.failed())
                return result;
            if (const auto result = parseOptionalStringProperty(*courseProps, "name", "settings.course", next.course.name); result.failed())
                return result;
        }

        if (const auto result = parseNullableString(*props, "course_verified_at", "settings", next.courseVerifiedAt); result.failed())
            return result;
        if (const auto result = parseNullableString(*props, "git_connection", "settings", next.gitConnection); result.failed())
            return result;

        if (props->contains("operations"))
        {
            if (const auto result = parseOperations((*props)["operations"], next.operations, warningsOut); result.failed())
                return result;
        }

        if (props->contains("exports"))
        {
            if (const auto result = parseExports((*props)["exports"], next.exports); result.failed())
                return result;
        }

        settingsOut = std::move(next);
        return juce::Result::ok();
    }

    juce::var rosterToVar(const Roster& roster)
    {
        auto root = std::make_unique<juce::DynamicObject>();
        if (roster.connection.has_value())
            root->setProperty("connection", serializeRosterConnection(*roster.connection));

        juce::Array<juce::var> students;
        for (const auto& member : roster.students)
            students.add(serializeMember(member));
        root->setProperty("students", juce::var(students));

        juce::Array<juce::var> staff;
        for (const auto& member : roster.staff)
            staff.add(serializeMember(member));
        root->setProperty("staff", juce::var(staff));

        juce::Array<juce::var> groups;
        for (const auto& group : roster.groups)
            groups.add(serializeGroup(group));
        root->setProperty("groups", juce::var(groups));

        juce::Array<juce::var> groupSets;
        for (const auto& groupSet : roster.groupSets)
            groupSets.add(serializeGroupSet(groupSet));
        root->setProperty("group_sets", juce::var(groupSets));

        juce::Array<juce::var> assignments;
        for (const auto& assignment : roster.assignments)
            assignments.add(serializeAssignment(assignment));
        root->setProperty("assignments", juce::var(assignments));

        return juce::var(root.release());
    }

    juce::Result rosterFromVar(const juce::var& value, Roster& rosterOut, juce::StringArray& warningsOut)
    {
        const juce::NamedValueSet* props = nullptr;
        if (const auto result = requireObject(value, "roster", props); result.failed())
            return result;

        Roster next;
        if (const auto result = parseRosterConnection((*props)["connection"], next.connection); result.failed())
            return result;

        const auto memberParser = [&warningsOut](const juce::var& item, RosterMember& member)
        {
            return parseMember(item, member, warningsOut);
        };

        if (const auto result = parseItemArray(*props, "students", next.students, memberParser); result.failed())
            return result;
        if (const auto result = parseItemArray(*props, "staff", next.staff, memberParser); result.failed())
            return result;

        if (const auto result = parseItemArray(*props,
                                               "groups",
                                               next.groups,
                                               [&warningsOut](const juce::var& item, Group& group)
                                               {
                                                   return parseGroup(item, group, warningsOut);
                                               });
            result.failed())
            return result;

        if (const auto result = parseItemArray(*props,
                                               "group_sets",
                                               next.groupSets,
                                               [](const juce::var& item, GroupSet& groupSet)
                                               {
                                                   return parseGroupSet(item, groupSet);
                                               });
            result.failed())
            return result;

        if (const auto result = parseItemArray(*props,
                                               "assignments",
                                               next.assignments,
                                               [&warningsOut](const juce::var& item, Assignment& assignment)
                                               {
                                                   return parseAssignment(item, assignment, warningsOut);
                                               });
            result.failed())
            return result;

        rosterOut = std::move(next);
        return juce::Result::ok();
    }

    juce::var validationResultToVar(const ValidationResult& result)
    {
        juce::Array<juce::var> issues;
        for (const auto& issue : result.issues)
        {
            auto object = std::make_unique<juce::DynamicObject>();
            object->setProperty("kind", validationKindToKey(issue.kind));
            object->setProperty("affected_ids", makeStringArray(issue.affectedIds));
            object->setProperty("blocking", isBlockingValidation(issue.kind));
            setOptionalString(*object, "context", issue.context);
            issues.add(juce::var(object.release()));
        }

        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("issues", juce::var(issues));
        return juce::var(root.release());
    }

    juce::Result serializeSettingsToJsonString(const ProfileSettings& settings, juce::String& jsonOut)
    {
        jsonOut = juce::JSON::toString(settingsToVar(settings), true);
        return juce::Result::ok();
    }

    juce::Result parseSettingsFromJsonString(const juce::String& json,
                                             ProfileSettings& settingsOut,
                                             juce::StringArray& warningsOut)
    {
        juce::var root;
        if (const auto result = parseJsonRoot(json, root); result.failed())
            return result;

        return settingsFromVar(root, settingsOut, warningsOut);
    }

    juce::Result serializeRosterToJsonString(const Roster& roster, juce::String& jsonOut)
    {
        jsonOut = juce::JSON::toString(rosterToVar(roster), true);
        return juce::Result::ok();
    }

    juce::Result parseRosterFromJsonString(const juce::String& json, Roster& rosterOut, juce::StringArray& warningsOut)
    {
        juce::var root;
        if (const auto result = parseJsonRoot(json, root); result.failed())
            return result;

        return rosterFromVar(root, rosterOut, warningsOut);
    }

    juce::Result saveSettingsToFile(const juce::File& file, const ProfileSettings& settings)
    {
        juce::String json;
        if (const auto result = serializeSettingsToJsonString(settings, json); result.failed())
            return result;

        return writeJsonFile(file, json);
    }

    juce::Result loadSettingsFromFile(const juce::File& file, ProfileSettings& settingsOut, juce::StringArray& warningsOut)
    {
        juce::String text;
        if (const auto result = readJsonFile(file, text); result.failed())
            return result;

        return parseSettingsFromJsonString(text, settingsOut, warningsOut);
    }

    juce::Result saveRosterToFile(const juce::File& file, const Roster& roster)
    {
        juce::String json;
        if (const auto result = serializeRosterToJsonString(roster, json); result.failed())
            return result;

        return writeJsonFile(file, json);
    }

    juce::Result loadRosterFromFile(const juce::File& file, Roster& rosterOut, juce::StringArray& warningsOut)
    {
        juce::String text;
        if (const auto result = readJsonFile(file, text); result.failed())
            return result;

        return parseRosterFromJsonString(text, rosterOut, warningsOut);
    }
}
