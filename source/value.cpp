// value.cpp - Value accessors, hashing and text rendering

#include <structdiff/value.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace structdiff {

namespace {

std::string format_real(double v)
{
    // Enough digits that distinct doubles never print the same
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return oss.str();
}

std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Bool:    return "bool";
        case ValueKind::Integer: return "integer";
        case ValueKind::Real:    return "real";
        case ValueKind::String:  return "string";
        case ValueKind::Set:     return "set";
        case ValueKind::Vector:  return "vector";
        case ValueKind::Matrix:  return "matrix";
        case ValueKind::Record:  return "record";
        case ValueKind::Dict:    return "dict";
        case ValueKind::Null:    return "null";
    }
    return "unknown";
}

// ============================================================
// Accessors
// ============================================================

Value Value::at(std::size_t index) const
{
    if (auto* vec = get_if<ValueVector>()) {
        if (index < vec->size()) return (*vec)[index].get();
        detail::log_index_error("Value::at", index, "out of range");
        return {};
    }
    detail::log_error("Value::at", "not a vector");
    return {};
}

Value Value::at(std::size_t row, std::size_t col) const
{
    if (auto* m = get_if<ValueMatrix>()) {
        if (row < m->rows() && col < m->cols()) return (*m)(row, col).get();
        detail::log_index_error("Value::at", row * m->cols() + col, "out of range");
        return {};
    }
    detail::log_error("Value::at", "not a matrix");
    return {};
}

Value Value::field(const std::string& name) const
{
    if (auto* rec = get_if<ValueRecord>()) {
        if (auto* v = find_field(*rec, name)) return v->get();
    } else if (auto* dict = get_if<ValueDict>()) {
        if (auto* v = dict->find(name)) return v->get();
    } else {
        detail::log_error("Value::field", "not a record or dict");
        return {};
    }
    detail::log_key_error("Value::field", name, "not found");
    return {};
}

bool Value::contains(const Value& element) const
{
    if (auto* set = get_if<ValueSet>()) {
        return set->count(ValueBox{element}) > 0;
    }
    return false;
}

std::size_t Value::size() const noexcept
{
    return std::visit(
        [](const auto& arg) -> std::size_t {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, ValueSet> || std::is_same_v<T, ValueVector> ||
                          std::is_same_v<T, ValueMatrix> || std::is_same_v<T, ValueRecord> ||
                          std::is_same_v<T, ValueDict>) {
                return arg.size();
            } else {
                return 0;
            }
        },
        data);
}

// ============================================================
// Hashing
// ============================================================

std::size_t hash_value(const Value& v)
{
    std::size_t seed = v.data.index();
    std::visit(
        [&seed](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, ValueSet> || std::is_same_v<T, ValueDict>) {
                seed = detail::hash_unordered(arg, seed);
            } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueRecord>) {
                seed = detail::hash_ordered(arg, seed);
            } else {
                boost::hash_combine(seed, detail::hash_element(arg));
            }
        },
        v.data);
    return seed;
}

// ============================================================
// Rendering
// ============================================================

std::string value_to_string(const Value& val)
{
    return std::visit(
        [](const auto& arg) -> std::string {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + arg + "\"";
            } else if constexpr (std::is_same_v<T, bool>) {
                return arg ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(arg);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_real(arg);
            } else if constexpr (std::is_same_v<T, ValueSet>) {
                // Hash order is arbitrary; sort so equal sets render equally
                std::vector<std::string> parts;
                for (const auto& element : arg) {
                    parts.push_back(value_to_string(element.get()));
                }
                std::sort(parts.begin(), parts.end());
                return "{" + join(parts, ", ") + "}";
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                std::vector<std::string> parts;
                for (const auto& element : arg) {
                    parts.push_back(value_to_string(element.get()));
                }
                return "[" + join(parts, ", ") + "]";
            } else if constexpr (std::is_same_v<T, ValueMatrix>) {
                std::vector<std::string> rows;
                for (std::size_t r = 0; r < arg.rows(); ++r) {
                    std::vector<std::string> cells;
                    for (std::size_t c = 0; c < arg.cols(); ++c) {
                        cells.push_back(value_to_string(arg(r, c).get()));
                    }
                    rows.push_back(join(cells, " "));
                }
                return "[" + join(rows, "; ") + "]";
            } else if constexpr (std::is_same_v<T, ValueRecord>) {
                std::vector<std::string> parts;
                for (const auto& f : arg) {
                    parts.push_back(f.name + " = " + value_to_string(f.value.get()));
                }
                return "(" + join(parts, ", ") + ")";
            } else if constexpr (std::is_same_v<T, ValueDict>) {
                std::vector<std::string> parts;
                for (const auto& [k, v] : arg) {
                    parts.push_back(k + " => " + value_to_string(v.get()));
                }
                std::sort(parts.begin(), parts.end());
                return "{" + join(parts, ", ") + "}";
            } else {
                return "null";
            }
        },
        val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, ValueSet>) {
                std::cout << indent << prefix << "set of " << arg.size() << ":\n";
                for (const auto& element : arg) {
                    print_value(element.get(), "- ", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << indent << prefix << "[" << i << "]:\n";
                    print_value(arg[i].get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueMatrix>) {
                std::cout << indent << prefix << arg.rows() << "x" << arg.cols() << " matrix\n";
                for (std::size_t r = 0; r < arg.rows(); ++r) {
                    std::cout << indent << "  ";
                    for (std::size_t c = 0; c < arg.cols(); ++c) {
                        if (c > 0) std::cout << " ";
                        std::cout << value_to_string(arg(r, c).get());
                    }
                    std::cout << "\n";
                }
            } else if constexpr (std::is_same_v<T, ValueRecord>) {
                for (const auto& f : arg) {
                    std::cout << indent << prefix << f.name << ":\n";
                    print_value(f.value.get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueDict>) {
                for (const auto& [k, v] : arg) {
                    std::cout << indent << prefix << k << ":\n";
                    print_value(v.get(), "", depth + 1);
                }
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

Vector<Value> positional_values(std::size_t n)
{
    auto t = Vector<Value>{}.transient();
    for (std::size_t i = 1; i <= n; ++i) {
        t.push_back(Value{static_cast<int64_t>(i)});
    }
    return t.persistent();
}

} // namespace structdiff
