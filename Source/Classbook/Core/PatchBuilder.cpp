#include "Classbook/Core/PatchBuilder.h"

#include <algorithm>
#include <set>

namespace
{
    using namespace Classbook;

    template <typename Item>
    void diffCollection(RosterCollection collection,
                        const std::vector<Item>& before,
                        const std::vector<Item>& after,
                        std::vector<Patch>& forward,
                        std::vector<Patch>& inverse)
    {
        const auto beforeSize = before.size();
        const auto afterSize = after.size();

        size_t prefix = 0;
        while (prefix < beforeSize && prefix < afterSize && before[prefix] == after[prefix])
            ++prefix;

        if (prefix == beforeSize && prefix == afterSize)
            return;

        size_t suffix = 0;
        const auto maxSuffix = std::min(beforeSize, afterSize) - prefix;
        while (suffix < maxSuffix && before[beforeSize - 1 - suffix] == after[afterSize - 1 - suffix])
            ++suffix;

        CollectionSplice<Item> splice;
        splice.collection = collection;
        splice.index = static_cast<int>(prefix);
        splice.removed.assign(before.begin() + static_cast<std::ptrdiff_t>(prefix),
                              before.end() - static_cast<std::ptrdiff_t>(suffix));
        splice.inserted.assign(after.begin() + static_cast<std::ptrdiff_t>(prefix),
                               after.end() - static_cast<std::ptrdiff_t>(suffix));
        if (suffix > 0)
            splice.anchorId = before[beforeSize - suffix].id;

        CollectionSplice<Item> reverse;
        reverse.collection = collection;
        reverse.index = splice.index;
        reverse.removed = splice.inserted;
        reverse.inserted = splice.removed;
        reverse.anchorId = splice.anchorId;

        forward.emplace_back(std::move(splice));
        inverse.emplace_back(std::move(reverse));
    }

    // Removal prefers the exact item at its recorded position, then any equal item,
    // then any item with the same id. Items that are already gone are skipped.
    template <typename Item>
    void applySplice(std::vector<Item>& items, const CollectionSplice<Item>& splice)
    {
        std::set<size_t> doomed;

        for (size_t k = 0; k < splice.removed.size(); ++k)
        {
            const auto& expected = splice.removed[k];
            const auto recorded = static_cast<size_t>(std::max(0, splice.index)) + k;

            if (recorded < items.size() && doomed.count(recorded) == 0 && items[recorded] == expected)
            {
                doomed.insert(recorded);
                continue;
            }

            std::optional<size_t> byId;
            std::optional<size_t> byValue;
            for (size_t i = 0; i < items.size(); ++i)
            {
                if (doomed.count(i) > 0 || items[i].id != expected.id)
                    continue;

                if (!byId.has_value())
                    byId = i;

                if (items[i] == expected)
                {
                    byValue = i;
                    break;
                }
            }

            if (byValue.has_value())
                doomed.insert(*byValue);
            else if (byId.has_value())
                doomed.insert(*byId);
        }

        for (auto it = doomed.rbegin(); it != doomed.rend(); ++it)
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(*it));

        if (splice.inserted.empty())
            return;

        auto insertAt = items.size();
        if (splice.anchorId.isNotEmpty())
        {
            const auto anchor = std::find_if(items.begin(),
                                             items.end(),
                                             [&splice](const Item& item)
                                             {
                                                 return item.id == splice.anchorId;
                                             });

            insertAt = anchor != items.end()
                       ? static_cast<size_t>(std::distance(items.begin(), anchor))
                       : std::min(static_cast<size_t>(std::max(0, splice.index)), items.size());
        }

        items.insert(items.begin() + static_cast<std::ptrdiff_t>(insertAt),
                     splice.inserted.begin(),
                     splice.inserted.end());
    }

    juce::Result requireRoster(std::optional<ProfileDocument>& draft, Roster*& rosterOut)
    {
        if (!draft.has_value())
            return juce::Result::fail("Patch requires a document");
        if (!draft->roster.has_value())
            return juce::Result::fail("Patch requires a roster");

        rosterOut = &(*draft->roster);
        return juce::Result::ok();
    }

    juce::Result applyPatch(std::optional<ProfileDocument>& draft, const Patch& patch)
    {
        return std::visit([&draft](const auto& typedPatch) -> juce::Result
                          {
                              using T = std::decay_t<decltype(typedPatch)>;

                              if constexpr (std::is_same_v<T, ReplaceDocumentPatch>)
                              {
                                  draft = typedPatch.document;
                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, ReplaceSettingsPatch>)
                              {
                                  if (!draft.has_value())
                                      return juce::Result::fail("Settings patch requires a document");

                                  draft->settings = typedPatch.settings;
                                  draft->resolvedIdentityMode = typedPatch.resolvedIdentityMode;
                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, ReplaceRosterPatch>)
                              {
                                  if (!draft.has_value())
                                      return juce::Result::fail("Roster patch requires a document");

                                  draft->roster = typedPatch.roster;
                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, RosterConnectionPatch>)
                              {
                                  Roster* roster = nullptr;
                                  const auto check = requireRoster(draft, roster);
                                  if (check.failed())
                                      return check;

                                  roster->connection = typedPatch.connection;
                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, MemberSplice>)
                              {
                                  Roster* roster = nullptr;
                                  const auto check = requireRoster(draft, roster);
                                  if (check.failed())
                                      return check;

                                  if (typedPatch.collection == RosterCollection::students)
                                      applySplice(roster->students, typedPatch);
                                  else if (typedPatch.collection == RosterCollection::staff)
                                      applySplice(roster->staff, typedPatch);
                                  else
                                      return juce::Result::fail("Member splice targets a non-member collection");

                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, GroupSplice>)
                              {
                                  Roster* roster = nullptr;
                                  const auto check = requireRoster(draft, roster);
                                  if (check.failed())
                                      return check;

                                  applySplice(roster->groups, typedPatch);
                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, GroupSetSplice>)
                              {
                                  Roster* roster = nullptr;
                                  const auto check = requireRoster(draft, roster);
                                  if (check.failed())
                                      return check;

                                  applySplice(roster->groupSets, typedPatch);
                                  return juce::Result::ok();
                              }
                              else if constexpr (std::is_same_v<T, AssignmentSplice>)
                              {
                                  Roster* roster = nullptr;
                                  const auto check = requireRoster(draft, roster);
                                  if (check.failed())
                                      return check;

                                  applySplice(roster->assignments, typedPatch);
                                  return juce::Result::ok();
                              }
                              else
                              {
                                  static_assert(kAlwaysFalse<T>, "unhandled patch");
                              }
                          },
                          patch);
    }
}

namespace Classbook::Core::PatchBuilder
{
    PatchSet diff(const ProfileDocument* before, const ProfileDocument* after, RosterDiff rosterDiff)
    {
        PatchSet patchSet;

        if (before == nullptr && after == nullptr)
            return patchSet;

        if (before == nullptr || after == nullptr)
        {
            ReplaceDocumentPatch forward;
            ReplaceDocumentPatch inverse;
            if (after != nullptr)
                forward.document = *after;
            if (before != nullptr)
                inverse.document = *before;

            patchSet.forward.emplace_back(std::move(forward));
            patchSet.inverse.emplace_back(std::move(inverse));
            return patchSet;
        }

        if (!(before->settings == after->settings) || before->resolvedIdentityMode != after->resolvedIdentityMode)
        {
            patchSet.forward.emplace_back(ReplaceSettingsPatch { after->settings, after->resolvedIdentityMode });
            patchSet.inverse.emplace_back(ReplaceSettingsPatch { before->settings, before->resolvedIdentityMode });
        }

        if (before->roster.has_value() != after->roster.has_value()
            || (rosterDiff == RosterDiff::wholeRoster && !(before->roster == after->roster)))
        {
            patchSet.forward.emplace_back(ReplaceRosterPatch { after->roster });
            patchSet.inverse.emplace_back(ReplaceRosterPatch { before->roster });
        }
        else if (before->roster.has_value())
        {
            const auto& from = *before->roster;
            const auto& to = *after->roster;

            if (!(from.connection == to.connection))
            {
                patchSet.forward.emplace_back(RosterConnectionPatch { to.connection });
                patchSet.inverse.emplace_back(RosterConnectionPatch { from.connection });
            }

            diffCollection(RosterCollection::students, from.students, to.students, patchSet.forward, patchSet.inverse);
            diffCollection(RosterCollection::staff, from.staff, to.staff, patchSet.forward, patchSet.inverse);
            diffCollection(RosterCollection::groups, from.groups, to.groups, patchSet.forward, patchSet.inverse);
            diffCollection(RosterCollection::groupSets, from.groupSets, to.groupSets, patchSet.forward, patchSet.inverse);
            diffCollection(RosterCollection::assignments, from.assignments, to.assignments, patchSet.forward, patchSet.inverse);
        }

        std::reverse(patchSet.inverse.begin(), patchSet.inverse.end());
        return patchSet;
    }

    juce::Result applyPatches(const DocumentPtr& document,
                              const std::vector<Patch>& patches,
                              DocumentPtr& documentOut)
    {
        std::optional<ProfileDocument> draft;
        if (document != nullptr)
            draft = *document;

        for (const auto& patch : patches)
        {
            const auto result = applyPatch(draft, patch);
            if (result.failed())
                return result;
        }

        documentOut = draft.has_value() ? std::make_shared<const ProfileDocument>(std::move(*draft)) : nullptr;
        return juce::Result::ok();
    }
}
