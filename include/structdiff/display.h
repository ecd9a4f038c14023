// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file display.h
/// @brief Human-readable summaries of difference values.
///
/// Layout (vector shown; sets print values only, matrices print
/// (rows, cols) identifier pairs):
/// @code
///   VectorDifference with indices:
///    common: [3]
///    added: [1]
///    removed: [2]
///   and values:
///    common: [-1]
///    added: [3]
///    removed: [4]
/// @endcode
///
/// Set elements and dict entries are sorted by their rendering so equal
/// differences always print the same text.

#pragma once

#include <structdiff/api.h>
#include <structdiff/difference.h>
#include <structdiff/value_diff.h>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace structdiff {

[[nodiscard]] STRUCTDIFF_API std::string to_string(const Delta& delta);
[[nodiscard]] STRUCTDIFF_API std::string to_string(const RecordDifference& d);
[[nodiscard]] STRUCTDIFF_API std::string to_string(const DictDifference& d);
[[nodiscard]] STRUCTDIFF_API std::string to_string(const Difference& d);

/// Single-line form used for nested differences, e.g. SetDifference(common: {2}, added: {}, removed: {1})
[[nodiscard]] STRUCTDIFF_API std::string to_compact_string(const Difference& d);

STRUCTDIFF_API std::ostream& operator<<(std::ostream& os, const Difference& d);

namespace detail {

inline void write_element(std::ostream& os, const Value& v) { os << value_to_string(v); }
inline void write_element(std::ostream& os, const ValueBox& v) { os << value_to_string(v.get()); }
inline void write_element(std::ostream& os, const Delta& d) { os << to_string(d); }
inline void write_element(std::ostream& os, std::monostate) { os << "nothing"; }

template <typename T>
    requires requires(std::ostream& os, const T& v) { os << v; }
void write_element(std::ostream& os, const T& v)
{
    os << v;
}

template <typename T>
[[nodiscard]] std::string element_string(const T& v)
{
    std::ostringstream oss;
    write_element(oss, v);
    return oss.str();
}

/// [a, b, c]
template <typename Range>
void write_sequence(std::ostream& os, const Range& range)
{
    os << "[";
    bool first = true;
    for (const auto& element : range) {
        if (!first) os << ", ";
        write_element(os, element);
        first = false;
    }
    os << "]";
}

/// {a, b, c}, sorted by rendering
template <typename Range>
void write_set(std::ostream& os, const Range& range)
{
    std::vector<std::string> parts;
    for (const auto& element : range) {
        parts.push_back(element_string(element));
    }
    std::sort(parts.begin(), parts.end());
    os << "{";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) os << ", ";
        os << parts[i];
    }
    os << "}";
}

template <typename RowId, typename ColId>
void write_indices(std::ostream& os, const MatrixIndices<RowId, ColId>& indices)
{
    os << "(";
    write_sequence(os, indices.rows);
    os << ", ";
    write_sequence(os, indices.cols);
    os << ")";
}

template <typename Indices>
void write_index_block(std::ostream& os, const Indices& modified, const Indices& added, const Indices& removed)
{
    auto write = [&os](const Indices& indices) {
        if constexpr (requires { indices.rows; }) {
            write_indices(os, indices);
        } else {
            write_sequence(os, indices);
        }
    };
    os << " common: ";
    write(modified);
    os << "\n added: ";
    write(added);
    os << "\n removed: ";
    write(removed);
}

template <typename Diff>
void write_indexed(std::ostream& os, std::string_view name, const Diff& d)
{
    os << name << " with indices:\n";
    write_index_block(os, d.modified_indices(), d.added_indices(), d.removed_indices());
    os << "\nand values:\n common: ";
    write_sequence(os, d.modified());
    os << "\n added: ";
    write_sequence(os, d.added());
    os << "\n removed: ";
    write_sequence(os, d.removed());
}

} // namespace detail

template <typename T, typename Hash>
[[nodiscard]] std::string to_string(const SetDifference<T, Hash>& d)
{
    std::ostringstream oss;
    oss << "SetDifference with values:\n common: ";
    detail::write_set(oss, d.common());
    oss << "\n added: ";
    detail::write_set(oss, d.added());
    oss << "\n removed: ";
    detail::write_set(oss, d.removed());
    return oss.str();
}

template <typename T, typename Id, typename D>
[[nodiscard]] std::string to_string(const VectorDifference<T, Id, D>& d)
{
    std::ostringstream oss;
    detail::write_indexed(oss, "VectorDifference", d);
    return oss.str();
}

template <typename T, typename RowId, typename ColId, typename D>
[[nodiscard]] std::string to_string(const MatrixDifference<T, RowId, ColId, D>& d)
{
    std::ostringstream oss;
    detail::write_indexed(oss, "MatrixDifference", d);
    return oss.str();
}

} // namespace structdiff
