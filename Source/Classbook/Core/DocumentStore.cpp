#include "Classbook/Core/DocumentStore.h"

#include "Classbook/Core/SystemGroupSets.h"

namespace Classbook::Core
{
    DocumentStore::DocumentStore()
        : history(kDefaultHistoryLimit)
    {
    }

    DocumentStore::DocumentStore(size_t historyLimit)
        : history(historyLimit)
    {
    }

    const DocumentPtr& DocumentStore::snapshot() const noexcept
    {
        return documentState;
    }

    bool DocumentStore::hasDocument() const noexcept
    {
        return documentState != nullptr;
    }

    bool DocumentStore::hasRoster() const noexcept
    {
        return documentState != nullptr && documentState->roster.has_value();
    }

    juce::Result DocumentStore::apply(const Action& action, ApplyOutcome* outcomeOut)
    {
        if (outcomeOut != nullptr)
            *outcomeOut = ApplyOutcome::unchanged;

        std::optional<ProfileDocument> draft;
        if (documentState != nullptr)
            draft = *documentState;

        const auto result = Reducer::apply(draft, action);
        if (result.failed())
            return result;

        const auto* after = draft.has_value() ? &(*draft) : nullptr;
        const auto rosterDiff = std::holds_alternative<SetRosterAction>(action) ? PatchBuilder::RosterDiff::wholeRoster
                                                                                : PatchBuilder::RosterDiff::collections;
        auto patchSet = PatchBuilder::diff(documentState.get(), after, rosterDiff);
        if (patchSet.isEmpty())
            return juce::Result::ok();

        HistoryEntry entry;
        entry.description = Reducer::describe(documentState.get(), action);
        entry.patches = std::move(patchSet.forward);
        entry.inversePatches = std::move(patchSet.inverse);

        documentState = draft.has_value() ? std::make_shared<const ProfileDocument>(std::move(*draft)) : nullptr;
        history.commit(std::move(entry));

        if (outcomeOut != nullptr)
            *outcomeOut = ApplyOutcome::committed;

        return juce::Result::ok();
    }

    void DocumentStore::replaceWithoutHistory(DocumentPtr document)
    {
        documentState = std::move(document);
    }

    void DocumentStore::reset(DocumentPtr document)
    {
        documentState = std::move(document);
        history.clear();
    }

    std::optional<HistoryEntry> DocumentStore::undo()
    {
        auto entry = history.undo(documentState);
        if (entry.has_value())
            dedupeSystemSets();

        return entry;
    }

    std::optional<HistoryEntry> DocumentStore::redo()
    {
        auto entry = history.redo(documentState);
        if (entry.has_value())
            dedupeSystemSets();

        return entry;
    }

    // Splices replayed over a roster the synchronizer has since rewritten can bring
    // back a second set of the same system type.
    void DocumentStore::dedupeSystemSets()
    {
        if (documentState == nullptr || !documentState->roster.has_value())
            return;

        auto next = std::make_shared<ProfileDocument>(*documentState);
        if (SystemGroupSets::dedupeSystemSets(*next->roster))
            documentState = std::move(next);
    }

    bool DocumentStore::canUndo() const noexcept
    {
        return history.canUndo();
    }

    bool DocumentStore::canRedo() const noexcept
    {
        return history.canRedo();
    }

    size_t DocumentStore::undoDepth() const noexcept
    {
        return history.undoDepth();
    }

    size_t DocumentStore::redoDepth() const noexcept
    {
        return history.redoDepth();
    }

    std::optional<juce::String> DocumentStore::nextUndoDescription() const
    {
        return history.nextUndoDescription();
    }

    std::optional<juce::String> DocumentStore::nextRedoDescription() const
    {
        return history.nextRedoDescription();
    }

    void DocumentStore::clearHistory()
    {
        history.clear();
    }

    void DocumentStore::setHistoryLimit(size_t limit) noexcept
    {
        history.setLimit(limit);
    }

    size_t DocumentStore::getHistoryLimit() const noexcept
    {
        return history.getLimit();
    }
}
