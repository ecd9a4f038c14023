// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Difference of two dynamic Values.
///
/// diff(const Value&, const Value&) matches the kinds of both arguments
/// and runs the set, vector, matrix, record or dict algorithm. The result
/// is a Difference, a closed variant over the five difference kinds.
///
/// Deltas of the dynamic layer are Delta values: a numeric Value
/// (new - old), a nested Difference when both sides hold the same kind of
/// container, or null when the elements have no meaningful delta.
///
/// Example:
/// @code
///   auto a = Value::record({{"a", 1}, {"b", 2}});
///   auto b = Value::record({{"b", 3}, {"c", 4}});
///   auto d = diff(a, b).get_if<RecordDifference>();
///   // d->modified() == {b: 1}, d->added() == {c: 4}, d->removed() == {a: 1}
/// @endcode

#pragma once

#include <structdiff/api.h>
#include <structdiff/container_diff.h>
#include <structdiff/difference.h>
#include <structdiff/value.h>

#include <cstdint>
#include <variant>

namespace structdiff {

struct Difference;

// ============================================================
// Delta - modified entry of a dynamic difference
// ============================================================

class Delta {
public:
    /// Null delta
    Delta() = default;
    Delta(Value value) : data_(std::move(value)) {}
    Delta(Difference nested);

    [[nodiscard]] bool is_value() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_difference() const noexcept { return data_.index() == 1; }

    /// Numeric (or null) delta; nullptr if this holds a nested difference
    [[nodiscard]] const Value* value() const noexcept { return std::get_if<Value>(&data_); }

    /// Nested difference; nullptr if this holds a value
    [[nodiscard]] const Difference* difference() const noexcept;

    bool operator==(const Delta& other) const;

private:
    std::variant<Value, Box<Difference>> data_;
};

/// Dynamic elements: numeric delta, nested diff, or null
template <>
struct DeltaTraits<ValueBox> {
    using delta_type = Delta;

    STRUCTDIFF_API static Delta compute(const ValueBox& old_value, const ValueBox& new_value);
};

// ============================================================
// Difference kinds of the dynamic layer
// ============================================================

using ValueSetDifference    = SetDifference<ValueBox, ValueBoxHash>;
using ValueVectorDifference = VectorDifference<ValueBox, Value, Delta>;
using ValueMatrixDifference = MatrixDifference<ValueBox, Value, Value, Delta>;

/// Difference of two records (named fields in declaration order)
///
/// modified() lists the common fields in the old record's order; added()
/// follows the new record's order.
class RecordDifference {
public:
    RecordDifference() = default;

    RecordDifference(Fields<Delta> modified, ValueRecord added, ValueRecord removed)
        : modified_(std::move(modified)), added_(std::move(added)), removed_(std::move(removed)) {}

    [[nodiscard]] const Fields<Delta>& modified() const noexcept { return modified_; }
    [[nodiscard]] const ValueRecord& added() const noexcept { return added_; }
    [[nodiscard]] const ValueRecord& removed() const noexcept { return removed_; }

    STRUCTDIFF_API bool operator==(const RecordDifference& other) const;

private:
    Fields<Delta> modified_;
    ValueRecord added_;
    ValueRecord removed_;
};

/// Difference of two dicts (string keys, no order)
class DictDifference {
public:
    using delta_map = Map<std::string, Delta>;

    DictDifference() = default;

    DictDifference(delta_map modified, ValueDict added, ValueDict removed)
        : modified_(std::move(modified)), added_(std::move(added)), removed_(std::move(removed)) {}

    [[nodiscard]] const delta_map& modified() const noexcept { return modified_; }
    [[nodiscard]] const ValueDict& added() const noexcept { return added_; }
    [[nodiscard]] const ValueDict& removed() const noexcept { return removed_; }

    STRUCTDIFF_API bool operator==(const DictDifference& other) const;

private:
    delta_map modified_;
    ValueDict added_;
    ValueDict removed_;
};

/// Kind of a Difference; matches the variant alternative order
enum class DiffKind : std::uint8_t {
    Set,
    Vector,
    Matrix,
    Record,
    Dict,
};

[[nodiscard]] STRUCTDIFF_API std::string_view kind_name(DiffKind kind) noexcept;

struct Difference
{
    std::variant<ValueSetDifference,
                 ValueVectorDifference,
                 ValueMatrixDifference,
                 RecordDifference,
                 DictDifference>
        data;

    Difference(ValueSetDifference d) : data(std::move(d)) {}
    Difference(ValueVectorDifference d) : data(std::move(d)) {}
    Difference(ValueMatrixDifference d) : data(std::move(d)) {}
    Difference(RecordDifference d) : data(std::move(d)) {}
    Difference(DictDifference d) : data(std::move(d)) {}

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] DiffKind kind() const noexcept { return static_cast<DiffKind>(data.index()); }

    bool operator==(const Difference& other) const { return data == other.data; }
};

// ============================================================
// Hashing (boost::hash protocol)
// ============================================================

[[nodiscard]] STRUCTDIFF_API std::size_t hash_value(const Delta& d);
[[nodiscard]] STRUCTDIFF_API std::size_t hash_value(const RecordDifference& d);
[[nodiscard]] STRUCTDIFF_API std::size_t hash_value(const DictDifference& d);
[[nodiscard]] STRUCTDIFF_API std::size_t hash_value(const Difference& d);

// ============================================================
// Delta inline members (need the complete Difference)
// ============================================================

inline Delta::Delta(Difference nested) : data_(Box<Difference>{std::move(nested)}) {}

inline const Difference* Delta::difference() const noexcept
{
    if (auto* box = std::get_if<Box<Difference>>(&data_)) return &box->get();
    return nullptr;
}

inline bool Delta::operator==(const Delta& other) const
{
    if (data_.index() != other.data_.index()) return false;
    if (auto* v = value()) return *v == *other.value();
    return *difference() == *other.difference();
}

// ============================================================
// diff() over dynamic values
// ============================================================

/// Diff two values of the same diffable kind
/// @throws ArgumentError if the kinds differ or are scalar
/// @throws TypeMismatch if a common record/dict field cannot be diffed
[[nodiscard]] STRUCTDIFF_API Difference diff(const Value& a, const Value& b);

/// Diff two vector values aligned by identifiers
/// @throws ArgumentError if either value is not a vector, or on bad identifiers
[[nodiscard]] STRUCTDIFF_API Difference diff(const Value& a,
                                             const Value& b,
                                             const Vector<Value>& ia,
                                             const Vector<Value>& ib);

/// Diff two matrix values aligned by row (ia, ib) and column (ja, jb) identifiers
/// @throws ArgumentError if either value is not a matrix, or on bad identifiers
[[nodiscard]] STRUCTDIFF_API Difference diff(const Value& a,
                                             const Value& b,
                                             const Vector<Value>& ia,
                                             const Vector<Value>& ja,
                                             const Vector<Value>& ib,
                                             const Vector<Value>& jb);

/// Record diff over field names
/// @throws ArgumentError if a record repeats a field name
/// @throws TypeMismatch on a common field that is neither numeric nor the same container kind
[[nodiscard]] STRUCTDIFF_API RecordDifference diff(const ValueRecord& a, const ValueRecord& b);

/// Dict diff over keys
/// @throws TypeMismatch as for records
[[nodiscard]] STRUCTDIFF_API DictDifference diff(const ValueDict& a, const ValueDict& b);

/// new - old for two numbers; int - int stays an integer unless it overflows, otherwise real
/// @return null Value if either side is not a number
[[nodiscard]] STRUCTDIFF_API Value numeric_delta(const Value& old_value, const Value& new_value);

} // namespace structdiff

template <>
struct std::hash<structdiff::Difference> {
    std::size_t operator()(const structdiff::Difference& d) const { return hash_value(d); }
};
