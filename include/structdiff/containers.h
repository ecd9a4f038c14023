// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file containers.h
/// @brief Persistent container aliases shared by values and differences.
///
/// All containers use one library-wide immer memory policy (see
/// STRUCTDIFF_ENABLE_THREAD_SAFE). Copies are O(1) and share structure,
/// which is what makes difference values cheap to return by value.
///
/// - Vector<T>:     immer::vector
/// - Set<T, Hash>:  immer::set
/// - Map<K, V>:     immer::map
/// - Matrix<T>:     dense rows x cols grid, row-major, over Vector<T>
/// - Fields<V>:     ordered name -> value mapping (declaration order)

#pragma once

#include <structdiff/structdiff_config.h>
#include <structdiff/api.h>
#include <structdiff/errors.h>
#include <structdiff/hashing.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/set.hpp>
#include <immer/set_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>

namespace structdiff {

// ============================================================
// Memory Policy
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

#if STRUCTDIFF_ENABLE_THREAD_SAFE
using memory_policy = thread_safe_memory_policy;
#else
using memory_policy = unsafe_memory_policy;
#endif

// ============================================================
// Container Aliases
// ============================================================

template <typename T>
using Vector = immer::vector<T, memory_policy>;

template <typename T, typename Hash = std::hash<T>>
using Set = immer::set<T, Hash, std::equal_to<T>, memory_policy>;

template <typename K, typename V, typename Hash = std::hash<K>>
using Map = immer::map<K, V, Hash, std::equal_to<K>, memory_policy>;

template <typename T>
using Box = immer::box<T, memory_policy>;

// ============================================================
// Matrix - dense 2-D grid stored row-major
// ============================================================

template <typename T>
class Matrix {
public:
    using value_type   = T;
    using storage_type = Vector<T>;

    Matrix() = default;

    /// @throws ArgumentError if cells.size() != rows * cols
    Matrix(std::size_t rows, std::size_t cols, storage_type cells)
        : rows_(rows), cols_(cols), cells_(std::move(cells))
    {
        if (cells_.size() != rows_ * cols_) {
            detail::raise<ArgumentError>(
                "Matrix", "expected " + std::to_string(rows_ * cols_) + " cells for a " +
                              std::to_string(rows_) + "x" + std::to_string(cols_) +
                              " matrix, got " + std::to_string(cells_.size()));
        }
    }

    /// Build from nested rows, e.g. Matrix<int>{{1, 2}, {3, 4}}
    /// @throws ArgumentError if the rows have different lengths
    Matrix(std::initializer_list<std::initializer_list<T>> rows)
    {
        auto t = storage_type{}.transient();
        rows_ = rows.size();
        cols_ = rows_ == 0 ? 0 : rows.begin()->size();
        for (const auto& row : rows) {
            if (row.size() != cols_) {
                detail::raise<ArgumentError>("Matrix", "rows must all have the same length");
            }
            for (const auto& cell : row) {
                t.push_back(cell);
            }
        }
        cells_ = t.persistent();
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }
    [[nodiscard]] std::size_t size() const noexcept { return cells_.size(); }
    [[nodiscard]] bool empty() const noexcept { return cells_.size() == 0; }

    /// Cell at (row, col); no bounds check beyond immer's own
    [[nodiscard]] const T& operator()(std::size_t row, std::size_t col) const
    {
        return cells_[row * cols_ + col];
    }

    /// Row-major cell storage
    [[nodiscard]] const storage_type& cells() const noexcept { return cells_; }

    bool operator==(const Matrix& other) const
    {
        return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
    }

    friend std::size_t hash_value(const Matrix& m)
    {
        std::size_t seed = detail::hash_tag("Matrix");
        boost::hash_combine(seed, m.rows_);
        boost::hash_combine(seed, m.cols_);
        return detail::hash_ordered(m.cells_, seed);
    }

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    storage_type cells_;
};

// ============================================================
// Field / Fields - ordered name -> value mapping
// ============================================================

template <typename V>
struct Field {
    std::string name;
    V value;

    bool operator==(const Field& other) const
    {
        return name == other.name && value == other.value;
    }

    friend std::size_t hash_value(const Field& f)
    {
        std::size_t seed = boost::hash<std::string>{}(f.name);
        boost::hash_combine(seed, detail::hash_element(f.value));
        return seed;
    }
};

/// Ordered name -> value mapping; iteration follows declaration order
template <typename V>
using Fields = Vector<Field<V>>;

/// Linear lookup by name (records are small)
/// @return Pointer to the field value, or nullptr if absent
template <typename V>
[[nodiscard]] const V* find_field(const Fields<V>& fields, const std::string& name)
{
    for (const auto& f : fields) {
        if (f.name == name) return &f.value;
    }
    return nullptr;
}

} // namespace structdiff
