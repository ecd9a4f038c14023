// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file alignment.h
/// @brief Identifier alignment between an old and a new container.
///
/// Given the identifiers of the old container (ia) and of the new one (ib),
/// align() partitions them into
///   - modified = ia ∩ ib   (in ia order)
///   - added    = ib − ia   (in ib order)
///   - removed  = ia − ib   (in ia order)
/// and records, for every partition entry, its offset in ia and/or ib.
///
/// Identifiers must be unique within each side. Each side gets one
/// identifier -> offset hash index: O(n) to build, O(1) per lookup.

#pragma once

#include <structdiff/containers.h>
#include <structdiff/errors.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace structdiff {

/// Identifier usable as an alignment key
template <typename Id, typename Hash = std::hash<Id>>
concept Identifier = std::equality_comparable<Id> && std::copy_constructible<Id> &&
                     requires(const Hash& h, const Id& id) {
                         { h(id) } -> std::convertible_to<std::size_t>;
                     };

/// Sized range of identifiers
template <typename R, typename Id>
concept IdentifierRange = requires(const R& r) {
    { r.size() } -> std::convertible_to<std::size_t>;
    { *r.begin() } -> std::convertible_to<const Id&>;
    r.end();
};

// ============================================================
// IndexMap - identifier -> offset lookup for one side
// ============================================================

template <typename Id, typename Hash = std::hash<Id>>
    requires Identifier<Id, Hash>
class IndexMap {
public:
    IndexMap() = default;

    /// Index every identifier of `ids` by its offset
    /// @param side Name used in error messages ("old", "new row", ...)
    /// @throws ArgumentError if an identifier occurs twice
    template <typename Range>
        requires IdentifierRange<Range, Id>
    static IndexMap build(const Range& ids, std::string_view side)
    {
        IndexMap map;
        map.offsets_.reserve(ids.size());
        std::size_t offset = 0;
        for (const auto& id : ids) {
            if (!map.offsets_.emplace(id, offset).second) {
                detail::raise<ArgumentError>("align", std::string(side) +
                                                          " identifiers are not unique (duplicate at offset " +
                                                          std::to_string(offset) + ")");
            }
            ++offset;
        }
        return map;
    }

    [[nodiscard]] std::optional<std::size_t> find(const Id& id) const
    {
        auto it = offsets_.find(id);
        if (it == offsets_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool contains(const Id& id) const { return offsets_.count(id) > 0; }

    [[nodiscard]] std::size_t size() const noexcept { return offsets_.size(); }

private:
    std::unordered_map<Id, std::size_t, Hash> offsets_;
};

// ============================================================
// Alignment - the three identifier partitions and their offsets
// ============================================================

template <typename Id>
struct Alignment {
    Vector<Id> modified;
    Vector<Id> added;
    Vector<Id> removed;

    Vector<std::size_t> modified_old;   ///< offset in ia of modified[k]
    Vector<std::size_t> modified_new;   ///< offset in ib of modified[k]
    Vector<std::size_t> added_new;      ///< offset in ib of added[k]
    Vector<std::size_t> removed_old;    ///< offset in ia of removed[k]
};

/// Check that every identifier in `ids` occurs once
/// @throws ArgumentError naming `side` otherwise
template <typename Id, typename Hash = std::hash<Id>, typename Range>
    requires IdentifierRange<Range, Id>
void require_unique(const Range& ids, std::string_view side)
{
    (void)IndexMap<Id, Hash>::build(ids, side);
}

/// Check that an identifier sequence labels every element of a container
/// @throws ArgumentError on a length mismatch
inline void require_length(std::size_t ids, std::size_t elements, std::string_view side)
{
    if (ids != elements) {
        detail::raise<ArgumentError>("diff", std::string(side) + " identifiers have length " +
                                                 std::to_string(ids) + ", expected " +
                                                 std::to_string(elements));
    }
}

/// Partition two identifier sequences
/// @param ia Old identifiers (unique)
/// @param ib New identifiers (unique)
/// @param side Prefix for error messages, e.g. "row" -> "old row identifiers ..."
/// @throws ArgumentError if either side has duplicates
template <typename Id, typename Hash = std::hash<Id>, typename OldIds, typename NewIds>
    requires IdentifierRange<OldIds, Id> && IdentifierRange<NewIds, Id>
[[nodiscard]] Alignment<Id> align(const OldIds& ia, const NewIds& ib, std::string_view side = "")
{
    const std::string suffix = side.empty() ? std::string{} : " " + std::string(side);
    const auto map_a = IndexMap<Id, Hash>::build(ia, "old" + suffix);
    const auto map_b = IndexMap<Id, Hash>::build(ib, "new" + suffix);

    auto modified     = Vector<Id>{}.transient();
    auto modified_old = Vector<std::size_t>{}.transient();
    auto modified_new = Vector<std::size_t>{}.transient();
    auto removed      = Vector<Id>{}.transient();
    auto removed_old  = Vector<std::size_t>{}.transient();

    std::size_t offset = 0;
    for (const auto& id : ia) {
        if (auto in_b = map_b.find(id)) {
            modified.push_back(id);
            modified_old.push_back(offset);
            modified_new.push_back(*in_b);
        } else {
            removed.push_back(id);
            removed_old.push_back(offset);
        }
        ++offset;
    }

    auto added     = Vector<Id>{}.transient();
    auto added_new = Vector<std::size_t>{}.transient();

    offset = 0;
    for (const auto& id : ib) {
        if (!map_a.contains(id)) {
            added.push_back(id);
            added_new.push_back(offset);
        }
        ++offset;
    }

    return Alignment<Id>{modified.persistent(),     added.persistent(),
                         removed.persistent(),      modified_old.persistent(),
                         modified_new.persistent(), added_new.persistent(),
                         removed_old.persistent()};
}

/// Positional identifiers 1..n, the default alignment keys
[[nodiscard]] inline Vector<std::size_t> positional_ids(std::size_t n)
{
    auto t = Vector<std::size_t>{}.transient();
    for (std::size_t i = 1; i <= n; ++i) {
        t.push_back(i);
    }
    return t.persistent();
}

} // namespace structdiff
