#pragma once

#include "Classbook/Public/Types.h"
#include <functional>
#include <optional>

namespace Classbook
{
    struct LoadedProfile
    {
        ProfileSettings settings;
        juce::StringArray warnings;
    };

    // -----------------------------------------------------------------------------
    //  Command Gateway
    //
    //  Asynchronous persistence and computation backend. Every call completes by
    //  invoking its callback exactly once on the message thread, either inline or
    //  later. A failed juce::Result carries the backend error message; the value
    //  argument is then default-constructed and must be ignored.
    // -----------------------------------------------------------------------------

    class CommandGateway
    {
    public:
        using LoadProfileCallback = std::function<void(juce::Result, LoadedProfile)>;
        using RosterCallback = std::function<void(juce::Result, Roster)>;
        using SaveCallback = std::function<void(juce::Result)>;
        using ValidationCallback = std::function<void(juce::Result, ValidationResult)>;
        using SystemGroupSetCallback = std::function<void(juce::Result, SystemGroupSetPatch)>;

        virtual ~CommandGateway() = default;

        virtual void loadProfile(const juce::String& profileName, LoadProfileCallback callback) = 0;
        virtual void getRoster(const juce::String& profileName, RosterCallback callback) = 0;
        virtual void saveProfileAndRoster(const juce::String& profileName,
                                          const ProfileSettings& settings,
                                          const std::optional<Roster>& roster,
                                          SaveCallback callback) = 0;

        virtual void validateRoster(const Roster& roster, ValidationCallback callback) = 0;
        virtual void validateAssignment(GitIdentityMode identityMode,
                                        const Roster& roster,
                                        const AssignmentId& assignmentId,
                                        ValidationCallback callback) = 0;
        virtual void ensureSystemGroupSets(const Roster& roster, SystemGroupSetCallback callback) = 0;

        virtual juce::Result getDefaultSettings(ProfileSettings& settingsOut) = 0;
    };
}
