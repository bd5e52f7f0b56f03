#pragma once

#include "Classbook/Core/History.h"
#include "Classbook/Core/Reducer.h"
#include <memory>
#include <optional>

namespace Classbook::Core
{
    using DocumentPtr = PatchBuilder::DocumentPtr;

    // Owns the current document and its history. Every committed document is a new
    // immutable snapshot, so callers may hold a DocumentPtr across edits.
    class DocumentStore
    {
    public:
        enum class ApplyOutcome
        {
            committed,
            unchanged
        };

        DocumentStore();
        explicit DocumentStore(size_t historyLimit);

        const DocumentPtr& snapshot() const noexcept;
        bool hasDocument() const noexcept;
        bool hasRoster() const noexcept;

        // Runs the reducer on a draft copy. A refused action or an action that changes
        // nothing leaves the document and history untouched.
        juce::Result apply(const Action& action, ApplyOutcome* outcomeOut = nullptr);

        // Derived-cache refresh outside undo history (system set reconciliation).
        void replaceWithoutHistory(DocumentPtr document);

        // New profile or explicit replacement: history starts over.
        void reset(DocumentPtr document);

        // A step that leaves two sets of one system type keeps the first of them.
        std::optional<HistoryEntry> undo();
        std::optional<HistoryEntry> redo();

        bool canUndo() const noexcept;
        bool canRedo() const noexcept;
        size_t undoDepth() const noexcept;
        size_t redoDepth() const noexcept;
        std::optional<juce::String> nextUndoDescription() const;
        std::optional<juce::String> nextRedoDescription() const;
        void clearHistory();

        void setHistoryLimit(size_t limit) noexcept;
        size_t getHistoryLimit() const noexcept;

    private:
        void dedupeSystemSets();

        DocumentPtr documentState;
        History history;
    };
}
