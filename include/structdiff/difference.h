// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file difference.h
/// @brief Immutable difference values for sets, vectors and matrices.
///
/// A difference value is produced once by diff() and only read afterwards.
/// Partitions:
///   - SetDifference:    common / added / removed elements
///   - VectorDifference: modified / added / removed identifiers, each with
///                       an aligned value sequence (deltas for modified)
///   - MatrixDifference: same, with (rows, cols) identifier pairs
///
/// The free functions common(), modified(), added(), removed() and the
/// *_indices() variants form the read-only accessor contract used by
/// display and hashing code.

#pragma once

#include <structdiff/containers.h>
#include <structdiff/errors.h>
#include <structdiff/hashing.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace structdiff {

// ============================================================
// DeltaTraits - how a modified element's delta is computed
// ============================================================

template <typename T>
concept Subtractable = requires(const T& a, const T& b) { b - a; };

/// Elements without subtraction carry no delta; only their positions matter
template <typename T>
struct DeltaTraits {
    using delta_type = std::monostate;

    static delta_type compute(const T&, const T&) { return {}; }
};

/// Arithmetic-like elements: delta = new - old.
/// Signed integer deltas wrap modulo 2^N instead of overflowing.
template <Subtractable T>
struct DeltaTraits<T> {
    using delta_type = std::decay_t<decltype(std::declval<const T&>() - std::declval<const T&>())>;

    static delta_type compute(const T& old_value, const T& new_value)
    {
        if constexpr (std::is_integral_v<T> && std::is_integral_v<delta_type> && std::is_signed_v<delta_type>) {
            using U = std::make_unsigned_t<delta_type>;
            return static_cast<delta_type>(static_cast<U>(new_value) - static_cast<U>(old_value));
        } else {
            return new_value - old_value;
        }
    }
};

template <typename T>
using delta_t = typename DeltaTraits<T>::delta_type;

// ============================================================
// SetDifference
// ============================================================

template <typename T, typename Hash = std::hash<T>>
class SetDifference {
public:
    using set_type = Set<T, Hash>;

    SetDifference() = default;

    SetDifference(set_type common, set_type added, set_type removed)
        : common_(std::move(common)), added_(std::move(added)), removed_(std::move(removed)) {}

    /// Elements present in both sets
    [[nodiscard]] const set_type& common() const noexcept { return common_; }

    /// Elements present only in the new set
    [[nodiscard]] const set_type& added() const noexcept { return added_; }

    /// Elements present only in the old set
    [[nodiscard]] const set_type& removed() const noexcept { return removed_; }

    bool operator==(const SetDifference& other) const
    {
        return common_ == other.common_ && added_ == other.added_ && removed_ == other.removed_;
    }

    friend std::size_t hash_value(const SetDifference& d)
    {
        std::size_t seed = detail::hash_tag("SetDifference");
        seed = detail::hash_unordered(d.common_, seed);
        seed = detail::hash_unordered(d.added_, seed);
        return detail::hash_unordered(d.removed_, seed);
    }

private:
    set_type common_;
    set_type added_;
    set_type removed_;
};

// ============================================================
// VectorDifference
// ============================================================

template <typename T, typename Id = std::size_t, typename D = delta_t<T>>
class VectorDifference {
public:
    using element_type = T;
    using id_type      = Id;
    using delta_type   = D;
    using index_vector = Vector<Id>;
    using value_vector = Vector<T>;
    using delta_vector = Vector<D>;

    VectorDifference() = default;

    /// @throws ArgumentError if a value sequence and its index sequence differ in length
    VectorDifference(index_vector modified_indices,
                     index_vector added_indices,
                     index_vector removed_indices,
                     delta_vector modified_values,
                     value_vector added_values,
                     value_vector removed_values)
        : modified_indices_(std::move(modified_indices))
        , added_indices_(std::move(added_indices))
        , removed_indices_(std::move(removed_indices))
        , modified_values_(std::move(modified_values))
        , added_values_(std::move(added_values))
        , removed_values_(std::move(removed_values))
    {
        check_length(modified_indices_.size(), modified_values_.size(), "modified");
        check_length(added_indices_.size(), added_values_.size(), "added");
        check_length(removed_indices_.size(), removed_values_.size(), "removed");
    }

    [[nodiscard]] const index_vector& modified_indices() const noexcept { return modified_indices_; }
    [[nodiscard]] const index_vector& added_indices() const noexcept { return added_indices_; }
    [[nodiscard]] const index_vector& removed_indices() const noexcept { return removed_indices_; }

    /// Deltas (new - old) aligned with modified_indices()
    [[nodiscard]] const delta_vector& modified() const noexcept { return modified_values_; }

    /// New values aligned with added_indices()
    [[nodiscard]] const value_vector& added() const noexcept { return added_values_; }

    /// Old values aligned with removed_indices()
    [[nodiscard]] const value_vector& removed() const noexcept { return removed_values_; }

    bool operator==(const VectorDifference& other) const
    {
        return modified_indices_ == other.modified_indices_ &&
               added_indices_ == other.added_indices_ &&
               removed_indices_ == other.removed_indices_ &&
               modified_values_ == other.modified_values_ &&
               added_values_ == other.added_values_ &&
               removed_values_ == other.removed_values_;
    }

    friend std::size_t hash_value(const VectorDifference& d)
    {
        std::size_t seed = detail::hash_tag("VectorDifference");
        seed = detail::hash_ordered(d.modified_indices_, seed);
        seed = detail::hash_ordered(d.added_indices_, seed);
        seed = detail::hash_ordered(d.removed_indices_, seed);
        seed = detail::hash_ordered(d.modified_values_, seed);
        seed = detail::hash_ordered(d.added_values_, seed);
        return detail::hash_ordered(d.removed_values_, seed);
    }

private:
    static void check_length(std::size_t indices, std::size_t values, const char* partition)
    {
        if (indices != values) {
            detail::raise<ArgumentError>("VectorDifference",
                                         std::string(partition) + " has " + std::to_string(indices) +
                                             " indices but " + std::to_string(values) + " values");
        }
    }

    index_vector modified_indices_;
    index_vector added_indices_;
    index_vector removed_indices_;
    delta_vector modified_values_;
    value_vector added_values_;
    value_vector removed_values_;
};

// ============================================================
// MatrixDifference
// ============================================================

/// Row and column identifiers of one matrix partition
template <typename RowId, typename ColId>
struct MatrixIndices {
    Vector<RowId> rows;
    Vector<ColId> cols;

    bool operator==(const MatrixIndices& other) const
    {
        return rows == other.rows && cols == other.cols;
    }

    friend std::size_t hash_value(const MatrixIndices& m)
    {
        return detail::hash_ordered(m.cols, detail::hash_ordered(m.rows));
    }
};

/// Matrix difference.
///
/// modified() holds |modified rows| x |modified cols| deltas, row-major over
/// the Cartesian product of modified_indices().rows and .cols. added() and
/// removed() hold the remaining cells of the new and old matrix, in each
/// matrix's own row-major order.
template <typename T, typename RowId = std::size_t, typename ColId = RowId, typename D = delta_t<T>>
class MatrixDifference {
public:
    using element_type = T;
    using row_id_type  = RowId;
    using col_id_type  = ColId;
    using delta_type   = D;
    using indices_type = MatrixIndices<RowId, ColId>;
    using value_vector = Vector<T>;
    using delta_vector = Vector<D>;

    MatrixDifference() = default;

    /// @throws ArgumentError if modified_values is not |rows| x |cols| long
    MatrixDifference(indices_type modified_indices,
                     indices_type added_indices,
                     indices_type removed_indices,
                     delta_vector modified_values,
                     value_vector added_values,
                     value_vector removed_values)
        : modified_indices_(std::move(modified_indices))
        , added_indices_(std::move(added_indices))
        , removed_indices_(std::move(removed_indices))
        , modified_values_(std::move(modified_values))
        , added_values_(std::move(added_values))
        , removed_values_(std::move(removed_values))
    {
        const auto expected = modified_indices_.rows.size() * modified_indices_.cols.size();
        if (modified_values_.size() != expected) {
            detail::raise<ArgumentError>("MatrixDifference",
                                         "modified region needs " + std::to_string(expected) +
                                             " values, got " + std::to_string(modified_values_.size()));
        }
    }

    [[nodiscard]] const indices_type& modified_indices() const noexcept { return modified_indices_; }
    [[nodiscard]] const indices_type& added_indices() const noexcept { return added_indices_; }
    [[nodiscard]] const indices_type& removed_indices() const noexcept { return removed_indices_; }

    [[nodiscard]] const delta_vector& modified() const noexcept { return modified_values_; }
    [[nodiscard]] const value_vector& added() const noexcept { return added_values_; }
    [[nodiscard]] const value_vector& removed() const noexcept { return removed_values_; }

    /// Delta at (row k, col l) of the modified region
    [[nodiscard]] const D& modified_at(std::size_t k, std::size_t l) const
    {
        return modified_values_[k * modified_indices_.cols.size() + l];
    }

    bool operator==(const MatrixDifference& other) const
    {
        return modified_indices_ == other.modified_indices_ &&
               added_indices_ == other.added_indices_ &&
               removed_indices_ == other.removed_indices_ &&
               modified_values_ == other.modified_values_ &&
               added_values_ == other.added_values_ &&
               removed_values_ == other.removed_values_;
    }

    friend std::size_t hash_value(const MatrixDifference& d)
    {
        std::size_t seed = detail::hash_tag("MatrixDifference");
        boost::hash_combine(seed, hash_value(d.modified_indices_));
        boost::hash_combine(seed, hash_value(d.added_indices_));
        boost::hash_combine(seed, hash_value(d.removed_indices_));
        seed = detail::hash_ordered(d.modified_values_, seed);
        seed = detail::hash_ordered(d.added_values_, seed);
        return detail::hash_ordered(d.removed_values_, seed);
    }

private:
    indices_type modified_indices_;
    indices_type added_indices_;
    indices_type removed_indices_;
    delta_vector modified_values_;
    value_vector added_values_;
    value_vector removed_values_;
};

// ============================================================
// Accessor contract
// ============================================================

template <typename Diff>
[[nodiscard]] decltype(auto) common(const Diff& d) requires requires { d.common(); }
{
    return d.common();
}

template <typename Diff>
[[nodiscard]] decltype(auto) modified(const Diff& d) requires requires { d.modified(); }
{
    return d.modified();
}

template <typename Diff>
[[nodiscard]] decltype(auto) added(const Diff& d) requires requires { d.added(); }
{
    return d.added();
}

template <typename Diff>
[[nodiscard]] decltype(auto) removed(const Diff& d) requires requires { d.removed(); }
{
    return d.removed();
}

template <typename Diff>
[[nodiscard]] decltype(auto) modified_indices(const Diff& d) requires requires { d.modified_indices(); }
{
    return d.modified_indices();
}

template <typename Diff>
[[nodiscard]] decltype(auto) added_indices(const Diff& d) requires requires { d.added_indices(); }
{
    return d.added_indices();
}

template <typename Diff>
[[nodiscard]] decltype(auto) removed_indices(const Diff& d) requires requires { d.removed_indices(); }
{
    return d.removed_indices();
}

} // namespace structdiff
