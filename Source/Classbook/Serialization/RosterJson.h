#pragma once

#include "Classbook/Public/Types.h"

namespace Classbook::Serialization
{
    juce::var settingsToVar(const ProfileSettings& settings);
    juce::Result settingsFromVar(const juce::var& value, ProfileSettings& settingsOut, juce::StringArray& warningsOut);

    juce::var rosterToVar(const Roster& roster);
    juce::Result rosterFromVar(const juce::var& value, Roster& rosterOut, juce::StringArray& warningsOut);

    juce::var validationResultToVar(const ValidationResult& result);

    juce::Result serializeSettingsToJsonString(const ProfileSettings& settings, juce::String& jsonOut);
    juce::Result parseSettingsFromJsonString(const juce::String& json,
                                             ProfileSettings& settingsOut,
                                             juce::StringArray& warningsOut);

    juce::Result serializeRosterToJsonString(const Roster& roster, juce::String& jsonOut);
    juce::Result parseRosterFromJsonString(const juce::String& json, Roster& rosterOut, juce::StringArray& warningsOut);

    juce::Result saveSettingsToFile(const juce::File& file, const ProfileSettings& settings);
    juce::Result loadSettingsFromFile(const juce::File& file, ProfileSettings& settingsOut, juce::StringArray& warningsOut);

    juce::Result saveRosterToFile(const juce::File& file, const Roster& roster);
    juce::Result loadRosterFromFile(const juce::File& file, Roster& rosterOut, juce::StringArray& warningsOut);
}
