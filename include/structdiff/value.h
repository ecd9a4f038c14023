// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic Value type: the closed set of things structdiff can diff.
///
/// A Value holds one of:
/// - Scalars: bool, integer (int64_t), real (double), string
/// - Diffable containers: set, vector, matrix, record, dict
/// - Null (std::monostate)
///
/// Containers nest through immer::box, so a Value is cheap to copy and
/// never mutated after construction. Records keep their fields in
/// declaration order; dicts are hash maps keyed by string.

#pragma once

#include <structdiff/structdiff_config.h>
#include <structdiff/api.h>
#include <structdiff/containers.h>
#include <structdiff/errors.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace structdiff {

struct Value;

using ValueBox = Box<Value>;

/// Hash functor for boxed values (set elements)
struct ValueBoxHash {
    std::size_t operator()(const ValueBox& box) const;
};

using ValueSet    = Set<ValueBox, ValueBoxHash>;
using ValueVector = Vector<ValueBox>;
using ValueMatrix = Matrix<ValueBox>;
using ValueRecord = Fields<ValueBox>;
using ValueDict   = Map<std::string, ValueBox>;

/// Kind of a Value; matches the variant alternative order
enum class ValueKind : std::uint8_t {
    Bool,
    Integer,
    Real,
    String,
    Set,
    Vector,
    Matrix,
    Record,
    Dict,
    Null,
};

[[nodiscard]] STRUCTDIFF_API std::string_view kind_name(ValueKind kind) noexcept;

struct STRUCTDIFF_API Value
{
    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 ValueSet,
                 ValueVector,
                 ValueMatrix,
                 ValueRecord,
                 ValueDict,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int v) noexcept : data(int64_t{v}) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueSet v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueMatrix v) : data(std::move(v)) {}
    Value(ValueRecord v) : data(std::move(v)) {}
    Value(ValueDict v) : data(std::move(v)) {}

    // Factory functions for container types

    static Value set(std::initializer_list<Value> init)
    {
        auto t = ValueSet{}.transient();
        for (const auto& val : init) {
            t.insert(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init)
    {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    /// Rows of equal length, e.g. Value::matrix({{1, 2}, {3, 4}})
    /// @throws ArgumentError on ragged rows
    static Value matrix(std::initializer_list<std::initializer_list<Value>> rows)
    {
        auto t = ValueVector{}.transient();
        const std::size_t cols = rows.size() == 0 ? 0 : rows.begin()->size();
        for (const auto& row : rows) {
            if (row.size() != cols) {
                detail::raise<ArgumentError>("Value::matrix", "rows must all have the same length");
            }
            for (const auto& cell : row) {
                t.push_back(ValueBox{cell});
            }
        }
        return Value{ValueMatrix{rows.size(), cols, t.persistent()}};
    }

    /// Record fields in declaration order; a repeated name replaces the earlier value
    static Value record(std::initializer_list<std::pair<std::string, Value>> init)
    {
        ValueRecord fields;
        for (const auto& [name, val] : init) {
            fields = with_field(std::move(fields), name, val);
        }
        return Value{std::move(fields)};
    }

    static Value dict(std::initializer_list<std::pair<std::string, Value>> init)
    {
        auto t = ValueDict{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }

    /// True for the kinds the diff dispatcher accepts
    [[nodiscard]] bool is_diffable() const noexcept
    {
        switch (kind()) {
            case ValueKind::Set:
            case ValueKind::Vector:
            case ValueKind::Matrix:
            case ValueKind::Record:
            case ValueKind::Dict:
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const
    {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const
    {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const
    {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    /// Integer or real as double
    [[nodiscard]] double as_number(double default_val = 0.0) const
    {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const
    {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    /// Vector element; null (and a log line) if out of range or not a vector
    [[nodiscard]] Value at(std::size_t index) const;

    /// Matrix cell; null (and a log line) if out of range or not a matrix
    [[nodiscard]] Value at(std::size_t row, std::size_t col) const;

    /// Record field or dict entry; null (and a log line) if absent
    [[nodiscard]] Value field(const std::string& name) const;

    /// Set membership
    [[nodiscard]] bool contains(const Value& element) const;

    /// Number of elements, cells, fields or entries; 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept;

    bool operator==(const Value& other) const;

private:
    static ValueRecord with_field(ValueRecord fields, const std::string& name, const Value& val)
    {
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (fields[i].name == name) {
                return fields.set(i, Field<ValueBox>{name, ValueBox{val}});
            }
        }
        return fields.push_back(Field<ValueBox>{name, ValueBox{val}});
    }
};

inline bool Value::operator==(const Value& other) const
{
    return data == other.data;
}

/// Kind-seeded hash; sets and dicts hash independently of element order
[[nodiscard]] STRUCTDIFF_API std::size_t hash_value(const Value& v);

[[nodiscard]] inline std::size_t hash_value(const ValueBox& box)
{
    return hash_value(box.get());
}

inline std::size_t ValueBoxHash::operator()(const ValueBox& box) const
{
    return hash_value(box.get());
}

// ============================================================
// Utility functions
// ============================================================

/// Compact single-line rendering, e.g. (a = 1, b = [1, 2])
[[nodiscard]] STRUCTDIFF_API std::string value_to_string(const Value& val);

/// Print Value as an indented tree
STRUCTDIFF_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Identifiers 1..n as integer Values (default alignment keys)
[[nodiscard]] STRUCTDIFF_API Vector<Value> positional_values(std::size_t n);

} // namespace structdiff

template <>
struct std::hash<structdiff::Value> {
    std::size_t operator()(const structdiff::Value& v) const { return hash_value(v); }
};
