// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of Value containers.
///
/// Each builder wraps an immer transient, so a container of n elements is
/// built with n in-place insertions instead of n persistent copies.
///
/// Example:
/// @code
///   Value v1 = RecordBuilder()
///       .set("name", "config")
///       .set("weights", VectorBuilder().push_back(1.0).push_back(2.0).finish())
///       .finish();
/// @endcode
///
/// A builder is single-use: after finish() it is in an unspecified state.

#pragma once

#include <structdiff/value.h>

#include <concepts>
#include <string>
#include <utility>

namespace structdiff {

/// Builder for ValueSet; duplicate elements collapse
class SetBuilder {
public:
    using transient_type = ValueSet::transient_type;

    SetBuilder() : transient_(ValueSet{}.transient()) {}
    explicit SetBuilder(const ValueSet& existing) : transient_(existing.transient()) {}

    SetBuilder(SetBuilder&&) noexcept = default;
    SetBuilder& operator=(SetBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    SetBuilder(const SetBuilder&) = delete;
    SetBuilder& operator=(const SetBuilder&) = delete;

    SetBuilder& insert(Value val)
    {
        transient_.insert(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const Value& val) const
    {
        return transient_.count(ValueBox{val}) > 0;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueSet finish_set() { return transient_.persistent(); }

private:
    transient_type transient_;
};

/// Builder for ValueVector
class VectorBuilder {
public:
    using transient_type = ValueVector::transient_type;

    VectorBuilder() : transient_(ValueVector{}.transient()) {}
    explicit VectorBuilder(const ValueVector& existing) : transient_(existing.transient()) {}

    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;
    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    VectorBuilder& push_back(Value val)
    {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    /// Replace the element at index (must be within current size)
    VectorBuilder& set(std::size_t index, Value val)
    {
        if (index < transient_.size()) {
            transient_.set(index, ValueBox{std::move(val)});
        } else {
            detail::log_index_error("VectorBuilder::set", index, "out of range");
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueVector finish_vector() { return transient_.persistent(); }

private:
    transient_type transient_;
};

/// Builder for ValueMatrix, filled row by row
class MatrixBuilder {
public:
    using transient_type = ValueVector::transient_type;

    explicit MatrixBuilder(std::size_t cols) : cols_(cols), transient_(ValueVector{}.transient()) {}

    MatrixBuilder(MatrixBuilder&&) noexcept = default;
    MatrixBuilder& operator=(MatrixBuilder&&) noexcept = default;
    MatrixBuilder(const MatrixBuilder&) = delete;
    MatrixBuilder& operator=(const MatrixBuilder&) = delete;

    /// Append one row
    /// @throws ArgumentError if the row length differs from the column count
    MatrixBuilder& push_row(std::initializer_list<Value> row)
    {
        if (row.size() != cols_) {
            detail::raise<ArgumentError>("MatrixBuilder::push_row",
                                         "expected " + std::to_string(cols_) + " cells, got " +
                                             std::to_string(row.size()));
        }
        for (const auto& cell : row) {
            transient_.push_back(ValueBox{cell});
        }
        ++rows_;
        return *this;
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }

    [[nodiscard]] Value finish() { return Value{finish_matrix()}; }

    [[nodiscard]] ValueMatrix finish_matrix() { return ValueMatrix{rows_, cols_, transient_.persistent()}; }

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    transient_type transient_;
};

/// Builder for ValueRecord; fields keep first-insertion order
class RecordBuilder {
public:
    using transient_type = ValueRecord::transient_type;

    RecordBuilder() : transient_(ValueRecord{}.transient()) {}
    explicit RecordBuilder(const ValueRecord& existing) : transient_(existing.transient()) {}

    RecordBuilder(RecordBuilder&&) noexcept = default;
    RecordBuilder& operator=(RecordBuilder&&) noexcept = default;
    RecordBuilder(const RecordBuilder&) = delete;
    RecordBuilder& operator=(const RecordBuilder&) = delete;

    /// Set a field; an existing field with the same name is replaced in place
    RecordBuilder& set(const std::string& name, Value val)
    {
        for (std::size_t i = 0; i < transient_.size(); ++i) {
            if (transient_[i].name == name) {
                transient_.set(i, Field<ValueBox>{name, ValueBox{std::move(val)}});
                return *this;
            }
        }
        transient_.push_back(Field<ValueBox>{name, ValueBox{std::move(val)}});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& name) const
    {
        for (std::size_t i = 0; i < transient_.size(); ++i) {
            if (transient_[i].name == name) return true;
        }
        return false;
    }

    /// Update a previously set field using a function; no-op if absent
    template <typename Fn>
        requires std::invocable<Fn, const Value&>
    RecordBuilder& update(const std::string& name, Fn&& fn)
    {
        for (std::size_t i = 0; i < transient_.size(); ++i) {
            if (transient_[i].name == name) {
                Value next = std::forward<Fn>(fn)(transient_[i].value.get());
                transient_.set(i, Field<ValueBox>{name, ValueBox{std::move(next)}});
                return *this;
            }
        }
        detail::log_key_error("RecordBuilder::update", name, "not found");
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueRecord finish_record() { return transient_.persistent(); }

private:
    transient_type transient_;
};

/// Builder for ValueDict
class DictBuilder {
public:
    using transient_type = ValueDict::transient_type;

    DictBuilder() : transient_(ValueDict{}.transient()) {}
    explicit DictBuilder(const ValueDict& existing) : transient_(existing.transient()) {}

    DictBuilder(DictBuilder&&) noexcept = default;
    DictBuilder& operator=(DictBuilder&&) noexcept = default;
    DictBuilder(const DictBuilder&) = delete;
    DictBuilder& operator=(const DictBuilder&) = delete;

    DictBuilder& set(const std::string& key, Value val)
    {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    DictBuilder& erase(const std::string& key)
    {
        transient_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return transient_.count(key) > 0; }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueDict finish_dict() { return transient_.persistent(); }

private:
    transient_type transient_;
};

} // namespace structdiff
