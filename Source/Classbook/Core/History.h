#pragma once

#include "Classbook/Core/PatchBuilder.h"
#include <algorithm>
#include <deque>
#include <optional>
#include <vector>

namespace Classbook::Core
{
    inline constexpr size_t kDefaultHistoryLimit = 100;

    // Undo/redo stacks of patch pairs. `past` is oldest-first, `future` is
    // soonest-first. Only the undo depth is bounded.
    class History
    {
    public:
        explicit History(size_t limit = kDefaultHistoryLimit)
            : historyLimit(std::max<size_t>(1, limit))
        {
        }

        void commit(HistoryEntry entry)
        {
            past.push_back(std::move(entry));
            future.clear();
            trimPast();
        }

        // Applies the newest entry's inverse patches to `document`. Returns the entry,
        // or nothing when there is no history or the patches did not apply. A failed
        // undo clears the history.
        std::optional<HistoryEntry> undo(PatchBuilder::DocumentPtr& document)
        {
            if (past.empty())
                return std::nullopt;

            PatchBuilder::DocumentPtr next;
            const auto result = PatchBuilder::applyPatches(document, past.back().inversePatches, next);
            if (result.failed())
            {
                DBG("[Classbook] undo failed, clearing history: " + result.getErrorMessage());
                clear();
                return std::nullopt;
            }

            document = std::move(next);
            auto entry = std::move(past.back());
            past.pop_back();
            future.push_front(entry);
            return entry;
        }

        // A failed redo drops the redo branch; the undo stack still matches `document`.
        std::optional<HistoryEntry> redo(PatchBuilder::DocumentPtr& document)
        {
            if (future.empty())
                return std::nullopt;

            PatchBuilder::DocumentPtr next;
            const auto result = PatchBuilder::applyPatches(document, future.front().patches, next);
            if (result.failed())
            {
                DBG("[Classbook] redo failed, dropping redo branch: " + result.getErrorMessage());
                future.clear();
                return std::nullopt;
            }

            document = std::move(next);
            auto entry = std::move(future.front());
            future.pop_front();
            past.push_back(entry);
            trimPast();
            return entry;
        }

        void clear()
        {
            past.clear();
            future.clear();
        }

        bool canUndo() const noexcept { return !past.empty(); }
        bool canRedo() const noexcept { return !future.empty(); }
        size_t undoDepth() const noexcept { return past.size(); }
        size_t redoDepth() const noexcept { return future.size(); }

        std::optional<juce::String> nextUndoDescription() const
        {
            if (past.empty())
                return std::nullopt;

            return past.back().description;
        }

        std::optional<juce::String> nextRedoDescription() const
        {
            if (future.empty())
                return std::nullopt;

            return future.front().description;
        }

        void setLimit(size_t limit) noexcept
        {
            historyLimit = std::max<size_t>(1, limit);
            trimPast();
        }

        size_t getLimit() const noexcept
        {
            return historyLimit;
        }

    private:
        void trimPast()
        {
            if (past.size() <= historyLimit)
                return;

            const auto overflow = past.size() - historyLimit;
            past.erase(past.begin(), past.begin() + static_cast<std::ptrdiff_t>(overflow));
        }

        std::vector<HistoryEntry> past;
        std::deque<HistoryEntry> future;
        size_t historyLimit = kDefaultHistoryLimit;
    };
}
