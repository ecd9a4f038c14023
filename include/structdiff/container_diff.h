// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file container_diff.h
/// @brief diff() overloads for typed sets, vectors and matrices.
///
/// Example:
/// @code
///   Vector<int> a{10, 20, 30};
///   Vector<int> b{99, 20, 30, 40};
///   auto d = diff(a, b, Vector<int>{1, 2, 3}, Vector<int>{2, 3, 4, 5});
///   // d.modified_indices() == [2, 3], d.modified() == [79, -10]
///   // d.added_indices()    == [4, 5], d.added()    == [30, 40]
///   // d.removed_indices()  == [1],    d.removed()  == [10]
/// @endcode
///
/// Without identifiers, elements are aligned by position (ids 1..N).
/// If either vector is empty, or either matrix is 0x0, the diff
/// short-circuits: the other side is reported whole as added or removed.

#pragma once

#include <structdiff/alignment.h>
#include <structdiff/containers.h>
#include <structdiff/difference.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace structdiff {

namespace detail {

/// Elements of `source` at the given offsets, in offset order
template <typename T>
[[nodiscard]] Vector<T> gather(const Vector<T>& source, const Vector<std::size_t>& offsets)
{
    auto t = Vector<T>{}.transient();
    for (auto offset : offsets) {
        t.push_back(source[offset]);
    }
    return t.persistent();
}

/// Deltas new[modified_new[k]] - old[modified_old[k]] for each k
template <typename T, typename Traits = DeltaTraits<T>>
[[nodiscard]] Vector<typename Traits::delta_type> gather_deltas(const Vector<T>& old_values,
                                                                const Vector<T>& new_values,
                                                                const Vector<std::size_t>& modified_old,
                                                                const Vector<std::size_t>& modified_new)
{
    auto t = Vector<typename Traits::delta_type>{}.transient();
    for (std::size_t k = 0; k < modified_old.size(); ++k) {
        t.push_back(Traits::compute(old_values[modified_old[k]], new_values[modified_new[k]]));
    }
    return t.persistent();
}

/// Membership flag per offset, set for every offset listed in `offsets`
[[nodiscard]] inline std::vector<bool> offset_flags(std::size_t count, const Vector<std::size_t>& offsets)
{
    std::vector<bool> flags(count, false);
    for (auto offset : offsets) {
        flags[offset] = true;
    }
    return flags;
}

/// Cells of `m` outside the rows x cols block, in row-major order
template <typename T>
[[nodiscard]] Vector<T> complement_cells(const Matrix<T>& m,
                                         const std::vector<bool>& in_rows,
                                         const std::vector<bool>& in_cols)
{
    auto t = Vector<T>{}.transient();
    for (std::size_t r = 0; r < m.rows(); ++r) {
        for (std::size_t c = 0; c < m.cols(); ++c) {
            if (!(in_rows[r] && in_cols[c])) {
                t.push_back(m(r, c));
            }
        }
    }
    return t.persistent();
}

template <typename Id, typename Hash>
void check_ids(const Vector<Id>& ids, std::size_t elements, std::string_view side)
{
    require_length(ids.size(), elements, side);
    require_unique<Id, Hash>(ids, side);
}

} // namespace detail

// ============================================================
// Set
// ============================================================

/// common = a ∩ b, added = b - a, removed = a - b
template <typename T, typename Hash>
[[nodiscard]] SetDifference<T, Hash> diff(const Set<T, Hash>& a, const Set<T, Hash>& b)
{
    const auto& smaller = a.size() <= b.size() ? a : b;
    const auto& larger  = a.size() <= b.size() ? b : a;

    auto common  = Set<T, Hash>{}.transient();
    auto added   = Set<T, Hash>{}.transient();
    auto removed = Set<T, Hash>{}.transient();

    for (const auto& element : smaller) {
        if (larger.count(element)) {
            common.insert(element);
        }
    }
    for (const auto& element : b) {
        if (!a.count(element)) {
            added.insert(element);
        }
    }
    for (const auto& element : a) {
        if (!b.count(element)) {
            removed.insert(element);
        }
    }
    return SetDifference<T, Hash>{common.persistent(), added.persistent(), removed.persistent()};
}

// ============================================================
// Vector
// ============================================================

/// Align by identifiers: ia labels the elements of a, ib those of b
/// @throws ArgumentError if an identifier sequence has the wrong length or repeats an identifier
template <typename T, typename Id, typename Hash = std::hash<Id>>
    requires Identifier<Id, Hash>
[[nodiscard]] VectorDifference<T, Id> diff(const Vector<T>& a,
                                           const Vector<T>& b,
                                           const Vector<Id>& ia,
                                           const Vector<Id>& ib)
{
    using result_type = VectorDifference<T, Id>;

    detail::check_ids<Id, Hash>(ia, a.size(), "old");
    detail::check_ids<Id, Hash>(ib, b.size(), "new");

    if (a.empty() || b.empty()) {
        return result_type{{}, b.empty() ? Vector<Id>{} : ib, a.empty() ? Vector<Id>{} : ia,
                           {},  b.empty() ? Vector<T>{} : b,   a.empty() ? Vector<T>{} : a};
    }

    const auto al = align<Id, Hash>(ia, ib);
    return result_type{al.modified,
                       al.added,
                       al.removed,
                       detail::gather_deltas(a, b, al.modified_old, al.modified_new),
                       detail::gather(b, al.added_new),
                       detail::gather(a, al.removed_old)};
}

/// Positional diff (identifiers 1..N on each side)
template <typename T>
[[nodiscard]] VectorDifference<T, std::size_t> diff(const Vector<T>& a, const Vector<T>& b)
{
    return diff<T, std::size_t>(a, b, positional_ids(a.size()), positional_ids(b.size()));
}

// ============================================================
// Matrix
// ============================================================

/// Align rows and columns independently
/// @param ia, ja Row / column identifiers of a
/// @param ib, jb Row / column identifiers of b
/// @throws ArgumentError per dimension, as for vectors
template <typename T, typename RowId, typename ColId,
          typename RowHash = std::hash<RowId>, typename ColHash = std::hash<ColId>>
    requires Identifier<RowId, RowHash> && Identifier<ColId, ColHash>
[[nodiscard]] MatrixDifference<T, RowId, ColId> diff(const Matrix<T>& a,
                                                     const Matrix<T>& b,
                                                     const Vector<RowId>& ia,
                                                     const Vector<ColId>& ja,
                                                     const Vector<RowId>& ib,
                                                     const Vector<ColId>& jb)
{
    using result_type  = MatrixDifference<T, RowId, ColId>;
    using indices_type = typename result_type::indices_type;

    detail::check_ids<RowId, RowHash>(ia, a.rows(), "old row");
    detail::check_ids<ColId, ColHash>(ja, a.cols(), "old column");
    detail::check_ids<RowId, RowHash>(ib, b.rows(), "new row");
    detail::check_ids<ColId, ColHash>(jb, b.cols(), "new column");

    // Only a 0x0 side short-circuits; a 0xN or Nx0 side still has
    // identifiers in its other dimension and goes through alignment.
    const bool a_none = a.rows() == 0 && a.cols() == 0;
    const bool b_none = b.rows() == 0 && b.cols() == 0;
    if (a_none || b_none) {
        return result_type{{},
                           b_none ? indices_type{} : indices_type{ib, jb},
                           a_none ? indices_type{} : indices_type{ia, ja},
                           {},
                           b_none ? Vector<T>{} : b.cells(),
                           a_none ? Vector<T>{} : a.cells()};
    }

    const auto rows = align<RowId, RowHash>(ia, ib, "row");
    const auto cols = align<ColId, ColHash>(ja, jb, "column");

    using Traits = DeltaTraits<T>;
    auto modified = Vector<typename Traits::delta_type>{}.transient();
    for (std::size_t k = 0; k < rows.modified.size(); ++k) {
        for (std::size_t l = 0; l < cols.modified.size(); ++l) {
            modified.push_back(Traits::compute(a(rows.modified_old[k], cols.modified_old[l]),
                                               b(rows.modified_new[k], cols.modified_new[l])));
        }
    }

    const auto rows_in_a = detail::offset_flags(a.rows(), rows.modified_old);
    const auto cols_in_a = detail::offset_flags(a.cols(), cols.modified_old);
    const auto rows_in_b = detail::offset_flags(b.rows(), rows.modified_new);
    const auto cols_in_b = detail::offset_flags(b.cols(), cols.modified_new);

    return result_type{indices_type{rows.modified, cols.modified},
                       indices_type{rows.added, cols.added},
                       indices_type{rows.removed, cols.removed},
                       modified.persistent(),
                       detail::complement_cells(b, rows_in_b, cols_in_b),
                       detail::complement_cells(a, rows_in_a, cols_in_a)};
}

/// Positional diff (row and column identifiers 1..N)
template <typename T>
[[nodiscard]] MatrixDifference<T, std::size_t, std::size_t> diff(const Matrix<T>& a, const Matrix<T>& b)
{
    return diff<T, std::size_t, std::size_t>(a, b, positional_ids(a.rows()), positional_ids(a.cols()),
                                             positional_ids(b.rows()), positional_ids(b.cols()));
}

} // namespace structdiff
