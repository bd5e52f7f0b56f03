#pragma once

#include "Classbook/Public/CommandGateway.h"
#include "Classbook/Public/Services.h"

namespace Classbook::Gateway
{
    // In-process backend. Each profile is a directory under the root holding
    // settings.json and, once a roster exists, roster.json. Every callback runs
    // before the call returns.
    class LocalCommandGateway final : public CommandGateway
    {
    public:
        LocalCommandGateway(juce::File rootDirectoryToUse, IdentifierService& identifiersToUse);

        void loadProfile(const juce::String& profileName, LoadProfileCallback callback) override;
        void getRoster(const juce::String& profileName, RosterCallback callback) override;
        void saveProfileAndRoster(const juce::String& profileName,
                                  const ProfileSettings& settings,
                                  const std::optional<Roster>& roster,
                                  SaveCallback callback) override;

        void validateRoster(const Roster& roster, ValidationCallback callback) override;
        void validateAssignment(GitIdentityMode identityMode,
                                const Roster& roster,
                                const AssignmentId& assignmentId,
                                ValidationCallback callback) override;
        void ensureSystemGroupSets(const Roster& roster, SystemGroupSetCallback callback) override;

        juce::Result getDefaultSettings(ProfileSettings& settingsOut) override;

        juce::StringArray listProfiles() const;
        juce::Result deleteProfile(const juce::String& profileName);
        juce::File getProfileDirectory(const juce::String& profileName) const;

    private:
        juce::Result resolveProfileDirectory(const juce::String& profileName, juce::File& directoryOut) const;

        juce::File rootDirectory;
        IdentifierService& identifiers;

        JUCE_DECLARE_NON_COPYABLE (LocalCommandGateway)
    };
}
