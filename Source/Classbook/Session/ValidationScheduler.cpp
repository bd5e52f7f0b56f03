#include "Classbook/Session/ValidationScheduler.h"

#include <set>

namespace Classbook::Session
{
    ValidationScheduler::ValidationScheduler(CommandGateway& gatewayToUse,
                                             DocumentProvider documentProviderToUse,
                                             int debounceMs)
        : gateway(gatewayToUse),
          documentProvider(std::move(documentProviderToUse)),
          rosterCall(debounceMs, [this] { dispatchRosterValidation(); }),
          assignmentCall(debounceMs, [this] { dispatchAssignmentValidation(); })
    {
    }

    ValidationScheduler::~ValidationScheduler()
    {
        cancelPending();
    }

    void ValidationScheduler::scheduleRosterValidation()
    {
        rosterCall.trigger();
    }

    void ValidationScheduler::scheduleAssignmentValidation()
    {
        assignmentCall.trigger();
    }

    void ValidationScheduler::scheduleAll()
    {
        scheduleRosterValidation();
        scheduleAssignmentValidation();
    }

    void ValidationScheduler::flushPending()
    {
        rosterCall.flush();
        assignmentCall.flush();
    }

    void ValidationScheduler::cancelPending()
    {
        rosterCall.cancel();
        assignmentCall.cancel();
    }

    bool ValidationScheduler::hasPending() const noexcept
    {
        return rosterCall.isPending() || assignmentCall.isPending();
    }

    void ValidationScheduler::reset()
    {
        cancelPending();
        ++rosterSequence;
        ++assignmentSequence;
        rosterValidation.reset();
        assignmentValidations.clear();
    }

    void ValidationScheduler::clearAssignmentValidations()
    {
        ++assignmentSequence;
        assignmentValidations.clear();
    }

    const std::optional<ValidationResult>& ValidationScheduler::getRosterValidation() const noexcept
    {
        return rosterValidation;
    }

    const std::map<AssignmentId, ValidationResult>& ValidationScheduler::getAssignmentValidations() const noexcept
    {
        return assignmentValidations;
    }

    const ValidationResult* ValidationScheduler::findAssignmentValidation(const AssignmentId& assignmentId) const noexcept
    {
        const auto it = assignmentValidations.find(assignmentId);
        return it != assignmentValidations.end() ? &it->second : nullptr;
    }

    void ValidationScheduler::dispatchRosterValidation()
    {
        const auto document = documentProvider != nullptr ? documentProvider() : nullptr;
        if (document == nullptr || !document->roster.has_value())
        {
            ++rosterSequence;
            if (rosterValidation.has_value())
            {
                rosterValidation.reset();
                notifyResultsChanged();
            }

            return;
        }

        const auto sequence = ++rosterSequence;
        const juce::WeakReference<ValidationScheduler> safeThis(this);

        gateway.validateRoster(*document->roster,
                               [safeThis, sequence](juce::Result result, ValidationResult validation)
                               {
                                   auto* self = safeThis.get();
                                   if (self == nullptr || sequence != self->rosterSequence)
                                       return;

                                   if (result.failed())
                                   {
                                       DBG("[Classbook][Validation] roster validation failed: " + result.getErrorMessage());
                                       return;
                                   }

                                   self->rosterValidation = std::move(validation);
                                   self->notifyResultsChanged();
                               });
    }

    void ValidationScheduler::dispatchAssignmentValidation()
    {
        const auto document = documentProvider != nullptr ? documentProvider() : nullptr;
        if (document == nullptr || !document->roster.has_value())
            return;

        const auto sequence = ++assignmentSequence;
        const auto& roster = *document->roster;

        if (roster.assignments.empty())
        {
            assignmentValidations.clear();
            notifyResultsChanged();
            return;
        }

        struct PendingBatch
        {
            std::map<AssignmentId, ValidationResult> results;
            std::set<AssignmentId> failedIds;
            size_t remaining = 0;
        };

        auto batch = std::make_shared<PendingBatch>();
        batch->remaining = roster.assignments.size();
        const juce::WeakReference<ValidationScheduler> safeThis(this);

        for (const auto& assignment : roster.assignments)
        {
            const auto assignmentId = assignment.id;
            gateway.validateAssignment(document->resolvedIdentityMode,
                                       roster,
                                       assignmentId,
                                       [safeThis, sequence, batch, assignmentId](juce::Result result, ValidationResult validation)
                                       {
                                           if (result.wasOk())
                                           {
                                               batch->results[assignmentId] = std::move(validation);
                                           }
                                           else
                                           {
                                               DBG("[Classbook][Validation] assignment " + assignmentId
                                                   + " validation failed: " + result.getErrorMessage());
                                               batch->failedIds.insert(assignmentId);
                                           }

                                           if (--batch->remaining > 0)
                                               return;

                                           auto* self = safeThis.get();
                                           if (self == nullptr || sequence != self->assignmentSequence)
                                               return;

                                           // A failed call keeps the last known result for that assignment.
                                           for (const auto& failedId : batch->failedIds)
                                           {
                                               if (const auto* previous = self->findAssignmentValidation(failedId))
                                                   batch->results[failedId] = *previous;
                                           }

                                           self->assignmentValidations = std::move(batch->results);
                                           self->notifyResultsChanged();
                                       });
        }
    }

    void ValidationScheduler::notifyResultsChanged()
    {
        if (onResultsChanged != nullptr)
            onResultsChanged();
    }
}
