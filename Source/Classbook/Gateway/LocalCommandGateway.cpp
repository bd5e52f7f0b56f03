#include "Classbook/Gateway/LocalCommandGateway.h"

#include "Classbook/Gateway/RosterValidator.h"
#include "Classbook/Gateway/SystemGroupSetBuilder.h"
#include "Classbook/Serialization/RosterJson.h"

namespace
{
    constexpr const char* kSettingsFileName = "settings.json";
    constexpr const char* kRosterFileName = "roster.json";
}

namespace Classbook::Gateway
{
    LocalCommandGateway::LocalCommandGateway(juce::File rootDirectoryToUse, IdentifierService& identifiersToUse)
        : rootDirectory(std::move(rootDirectoryToUse)),
          identifiers(identifiersToUse)
    {
    }

    juce::File LocalCommandGateway::getProfileDirectory(const juce::String& profileName) const
    {
        return rootDirectory.getChildFile(juce::File::createLegalFileName(profileName.trim()));
    }

    juce::Result LocalCommandGateway::resolveProfileDirectory(const juce::String& profileName, juce::File& directoryOut) const
    {
        if (profileName.trim().isEmpty())
            return juce::Result::fail("Profile name must not be empty");

        directoryOut = getProfileDirectory(profileName);
        return juce::Result::ok();
    }

    void LocalCommandGateway::loadProfile(const juce::String& profileName, LoadProfileCallback callback)
    {
        juce::File directory;
        LoadedProfile loaded;

        auto result = resolveProfileDirectory(profileName, directory);
        if (result.wasOk())
        {
            const auto file = directory.getChildFile(kSettingsFileName);
            if (!file.existsAsFile())
                result = juce::Result::fail("Profile not found: " + profileName);
            else
                result = Serialization::loadSettingsFromFile(file, loaded.settings, loaded.warnings);
        }

        if (result.failed())
            loaded = {};

        callback(result, std::move(loaded));
    }

    void LocalCommandGateway::getRoster(const juce::String& profileName, RosterCallback callback)
    {
        juce::File directory;
        Roster roster;

        auto result = resolveProfileDirectory(profileName, directory);
        if (result.wasOk())
        {
            const auto file = directory.getChildFile(kRosterFileName);
            if (file.existsAsFile())
            {
                juce::StringArray warnings;
                result = Serialization::loadRosterFromFile(file, roster, warnings);
                for (const auto& warning : warnings)
                {
                    DBG("[Classbook][Gateway] " + profileName + ": " + warning);
                    juce::ignoreUnused(warning);
                }
            }
        }

        if (result.failed())
            roster = {};

        callback(result, std::move(roster));
    }

    void LocalCommandGateway::saveProfileAndRoster(const juce::String& profileName,
                                                   const ProfileSettings& settings,
                                                   const std::optional<Roster>& roster,
                                                   SaveCallback callback)
    {
        juce::File directory;
        auto result = resolveProfileDirectory(profileName, directory);

        if (result.wasOk())
            result = Serialization::saveSettingsToFile(directory.getChildFile(kSettingsFileName), settings);

        if (result.wasOk())
        {
            const auto rosterFile = directory.getChildFile(kRosterFileName);
            if (roster.has_value())
                result = Serialization::saveRosterToFile(rosterFile, *roster);
            else if (rosterFile.existsAsFile() && !rosterFile.deleteFile())
                result = juce::Result::fail("Failed to remove roster file: " + rosterFile.getFullPathName());
        }

        callback(result);
    }

    void LocalCommandGateway::validateRoster(const Roster& roster, ValidationCallback callback)
    {
        callback(juce::Result::ok(), RosterValidator::validateRoster(roster));
    }

    void LocalCommandGateway::validateAssignment(GitIdentityMode identityMode,
                                                 const Roster& roster,
                                                 const AssignmentId& assignmentId,
                                                 ValidationCallback callback)
    {
        callback(juce::Result::ok(), RosterValidator::validateAssignment(roster, assignmentId, identityMode));
    }

    void LocalCommandGateway::ensureSystemGroupSets(const Roster& roster, SystemGroupSetCallback callback)
    {
        auto patch = SystemGroupSetBuilder::buildPatch(roster, identifiers);
        callback(juce::Result::ok(), std::move(patch));
    }

    juce::Result LocalCommandGateway::getDefaultSettings(ProfileSettings& settingsOut)
    {
        settingsOut = makeDefaultProfileSettings();
        return juce::Result::ok();
    }

    juce::StringArray LocalCommandGateway::listProfiles() const
    {
        juce::StringArray names;
        for (const auto& entry : juce::RangedDirectoryIterator(rootDirectory, false, "*", juce::File::findDirectories))
        {
            const auto directory = entry.getFile();
            if (directory.getChildFile(kSettingsFileName).existsAsFile())
                names.add(directory.getFileName());
        }

        names.sort(true);
        return names;
    }

    juce::Result LocalCommandGateway::deleteProfile(const juce::String& profileName)
    {
        juce::File directory;
        if (const auto result = resolveProfileDirectory(profileName, directory); result.failed())
            return result;

        if (!directory.isDirectory())
            return juce::Result::fail("Profile not found: " + profileName);

        if (!directory.deleteRecursively())
            return juce::Result::fail("Failed to delete profile: " + directory.getFullPathName());

        return juce::Result::ok();
    }
}
