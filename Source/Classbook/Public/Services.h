#pragma once

#include "Classbook/Public/Types.h"
#include <map>
#include <optional>

namespace Classbook
{
    enum class IdKind
    {
        member,
        group,
        groupSet,
        assignment
    };

    class IdentifierService
    {
    public:
        virtual ~IdentifierService() = default;

        // Must never return the same id twice within a session.
        virtual juce::String newId(IdKind kind) = 0;
    };

    class UuidIdentifierService final : public IdentifierService
    {
    public:
        juce::String newId(IdKind) override
        {
            return juce::Uuid().toDashedString();
        }
    };

    class AppSettingsLookup
    {
    public:
        virtual ~AppSettingsLookup() = default;

        virtual GitIdentityMode resolveIdentityMode(const std::optional<juce::String>& gitConnectionName) const = 0;
    };

    enum class GitServerType
    {
        gitHub,
        gitLab,
        gitea
    };

    struct GitConnection
    {
        GitServerType serverType = GitServerType::gitHub;
        juce::String baseUrl;
        std::optional<GitIdentityMode> identityMode;
    };

    // App-level registry of named git connections. Only GitLab servers honour a
    // configured identity mode; every other case resolves to username.
    class GitConnectionRegistry final : public AppSettingsLookup
    {
    public:
        void setConnection(const juce::String& name, GitConnection connection)
        {
            connections[name] = std::move(connection);
        }

        bool removeConnection(const juce::String& name)
        {
            return connections.erase(name) > 0;
        }

        const GitConnection* findConnection(const juce::String& name) const noexcept
        {
            const auto it = connections.find(name);
            return it != connections.end() ? &it->second : nullptr;
        }

        GitIdentityMode resolveIdentityMode(const std::optional<juce::String>& gitConnectionName) const override
        {
            if (!gitConnectionName.has_value() || gitConnectionName->isEmpty())
                return GitIdentityMode::username;

            const auto* connection = findConnection(*gitConnectionName);
            if (connection == nullptr)
                return GitIdentityMode::username;

            if (connection->serverType == GitServerType::gitLab)
                return connection->identityMode.value_or(GitIdentityMode::username);

            return GitIdentityMode::username;
        }

    private:
        std::map<juce::String, GitConnection> connections;
    };
}
