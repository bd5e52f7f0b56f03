#pragma once

#include "Classbook/Public/CommandGateway.h"
#include "Classbook/Session/DebouncedCall.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace Classbook::Session
{
    // Debounced, fire-and-forget validation against the gateway. Results are advisory:
    // a failed call is logged and the previous results stay in place.
    class ValidationScheduler
    {
    public:
        using DocumentProvider = std::function<std::shared_ptr<const ProfileDocument>()>;

        ValidationScheduler(CommandGateway& gatewayToUse,
                            DocumentProvider documentProviderToUse,
                            int debounceMs);
        ~ValidationScheduler();

        void scheduleRosterValidation();
        void scheduleAssignmentValidation();
        void scheduleAll();

        // Dispatches whatever is pending now instead of after the quiet period.
        void flushPending();
        void cancelPending();
        bool hasPending() const noexcept;

        // Drops results and invalidates in-flight dispatches.
        void reset();
        void clearAssignmentValidations();

        const std::optional<ValidationResult>& getRosterValidation() const noexcept;
        const std::map<AssignmentId, ValidationResult>& getAssignmentValidations() const noexcept;
        const ValidationResult* findAssignmentValidation(const AssignmentId& assignmentId) const noexcept;

        std::function<void()> onResultsChanged;

    private:
        void dispatchRosterValidation();
        void dispatchAssignmentValidation();
        void notifyResultsChanged();

        CommandGateway& gateway;
        DocumentProvider documentProvider;
        DebouncedCall rosterCall;
        DebouncedCall assignmentCall;

        uint64_t rosterSequence = 0;
        uint64_t assignmentSequence = 0;

        std::optional<ValidationResult> rosterValidation;
        std::map<AssignmentId, ValidationResult> assignmentValidations;

        JUCE_DECLARE_WEAK_REFERENCEABLE (ValidationScheduler)
        JUCE_DECLARE_NON_COPYABLE (ValidationScheduler)
    };
}
