#pragma once

#include "Classbook/Public/Patch.h"
#include <memory>
#include <vector>

namespace Classbook::Core::PatchBuilder
{
    using DocumentPtr = std::shared_ptr<const ProfileDocument>;

    struct PatchSet
    {
        std::vector<Patch> forward;
        std::vector<Patch> inverse; // replay order (reverse of forward)

        bool isEmpty() const noexcept { return forward.empty(); }
    };

    enum class RosterDiff
    {
        collections, // id-anchored splice per changed collection
        wholeRoster  // one roster replacement, for imports that swap the roster out
    };

    // Structural diff of two document states. Identical states yield an empty set.
    PatchSet diff(const ProfileDocument* before,
                  const ProfileDocument* after,
                  RosterDiff rosterDiff = RosterDiff::collections);

    // Applies patches in order to a copy of `document`. On failure `documentOut` is
    // left untouched.
    juce::Result applyPatches(const DocumentPtr& document,
                              const std::vector<Patch>& patches,
                              DocumentPtr& documentOut);
}
