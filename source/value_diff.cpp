// value_diff.cpp - diff() over dynamic Values and the Delta rules

#include <structdiff/value_diff.h>

#include <limits>
#include <string>

namespace structdiff {

namespace {

/// Same container kind on both sides: the dispatcher can recurse
bool same_diffable_kind(const Value& a, const Value& b)
{
    return a.kind() == b.kind() && a.is_diffable();
}

/// Delta of a common record/dict entry
/// @throws TypeMismatch unless both values are numbers or the same container kind
Delta entry_delta(std::string_view func, const std::string& name, const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        return Delta{numeric_delta(a, b)};
    }
    if (same_diffable_kind(a, b)) {
        return Delta{diff(a, b)};
    }
    detail::raise<TypeMismatch>(func, "field '" + name + "' cannot diff " + std::string(kind_name(a.kind())) +
                                          " with " + std::string(kind_name(b.kind())));
}

/// True if lhs - rhs does not fit in int64_t
bool sub_overflows(int64_t lhs, int64_t rhs)
{
    constexpr auto lo = std::numeric_limits<int64_t>::min();
    constexpr auto hi = std::numeric_limits<int64_t>::max();
    return rhs < 0 ? lhs > hi + rhs : lhs < lo + rhs;
}

[[noreturn]] void kind_error(std::string_view func, std::string_view expected, const Value& a, const Value& b)
{
    detail::raise<ArgumentError>(func, "expected two " + std::string(expected) + " values, got " +
                                           std::string(kind_name(a.kind())) + " and " +
                                           std::string(kind_name(b.kind())));
}

} // anonymous namespace

std::string_view kind_name(DiffKind kind) noexcept
{
    switch (kind) {
        case DiffKind::Set:    return "SetDifference";
        case DiffKind::Vector: return "VectorDifference";
        case DiffKind::Matrix: return "MatrixDifference";
        case DiffKind::Record: return "RecordDifference";
        case DiffKind::Dict:   return "DictDifference";
    }
    return "unknown";
}

// ============================================================
// Deltas
// ============================================================

Value numeric_delta(const Value& old_value, const Value& new_value)
{
    auto* old_int = old_value.get_if<int64_t>();
    auto* new_int = new_value.get_if<int64_t>();
    if (old_int && new_int && !sub_overflows(*new_int, *old_int)) {
        return Value{*new_int - *old_int};
    }
    if (old_value.is_number() && new_value.is_number()) {
        return Value{new_value.as_number() - old_value.as_number()};
    }
    return {};
}

Delta DeltaTraits<ValueBox>::compute(const ValueBox& old_value, const ValueBox& new_value)
{
    const Value& a = old_value.get();
    const Value& b = new_value.get();
    if (a.is_number() && b.is_number()) {
        return Delta{numeric_delta(a, b)};
    }
    if (same_diffable_kind(a, b)) {
        return Delta{diff(a, b)};
    }
    return {};
}

std::size_t hash_value(const Delta& d)
{
    if (auto* v = d.value()) return hash_value(*v);
    std::size_t seed = detail::hash_tag("Delta");
    boost::hash_combine(seed, hash_value(*d.difference()));
    return seed;
}

// ============================================================
// Record / Dict
// ============================================================

RecordDifference diff(const ValueRecord& a, const ValueRecord& b)
{
    auto names = [](const ValueRecord& rec) {
        auto t = Vector<std::string>{}.transient();
        for (const auto& f : rec) {
            t.push_back(f.name);
        }
        return t.persistent();
    };

    const auto al = align<std::string>(names(a), names(b), "field");

    auto modified = Fields<Delta>{}.transient();
    for (std::size_t k = 0; k < al.modified.size(); ++k) {
        const auto& name = al.modified[k];
        modified.push_back(Field<Delta>{
            name, entry_delta("diff(record)", name, a[al.modified_old[k]].value.get(),
                              b[al.modified_new[k]].value.get())});
    }

    return RecordDifference{modified.persistent(), detail::gather(b, al.added_new),
                            detail::gather(a, al.removed_old)};
}

DictDifference diff(const ValueDict& a, const ValueDict& b)
{
    auto modified = DictDifference::delta_map{}.transient();
    auto added    = ValueDict{}.transient();
    auto removed  = ValueDict{}.transient();

    for (const auto& [key, old_value] : a) {
        if (auto* new_value = b.find(key)) {
            modified.set(key, entry_delta("diff(dict)", key, old_value.get(), new_value->get()));
        } else {
            removed.set(key, old_value);
        }
    }
    for (const auto& [key, new_value] : b) {
        if (!a.count(key)) {
            added.set(key, new_value);
        }
    }
    return DictDifference{modified.persistent(), added.persistent(), removed.persistent()};
}

bool RecordDifference::operator==(const RecordDifference& other) const
{
    return modified_ == other.modified_ && added_ == other.added_ && removed_ == other.removed_;
}

std::size_t hash_value(const RecordDifference& d)
{
    std::size_t seed = detail::hash_tag("RecordDifference");
    seed = detail::hash_ordered(d.modified(), seed);
    seed = detail::hash_ordered(d.added(), seed);
    return detail::hash_ordered(d.removed(), seed);
}

bool DictDifference::operator==(const DictDifference& other) const
{
    return modified_ == other.modified_ && added_ == other.added_ && removed_ == other.removed_;
}

std::size_t hash_value(const DictDifference& d)
{
    std::size_t seed = detail::hash_tag("DictDifference");
    seed = detail::hash_unordered(d.modified(), seed);
    seed = detail::hash_unordered(d.added(), seed);
    return detail::hash_unordered(d.removed(), seed);
}

std::size_t hash_value(const Difference& d)
{
    return std::visit([](const auto& arg) { return hash_value(arg); }, d.data);
}

// ============================================================
// Dispatch
// ============================================================

Difference diff(const Value& a, const Value& b)
{
    if (a.kind() != b.kind()) {
        detail::raise<ArgumentError>("diff", "cannot diff " + std::string(kind_name(a.kind())) + " with " +
                                                 std::string(kind_name(b.kind())));
    }
    if (!a.is_diffable()) {
        detail::raise<ArgumentError>("diff", std::string(kind_name(a.kind())) + " values are not diffable");
    }

    return std::visit(
        [&b](const auto& lhs) -> Difference {
            using T = std::decay_t<decltype(lhs)>;
            if constexpr (std::is_same_v<T, ValueSet> || std::is_same_v<T, ValueRecord> ||
                          std::is_same_v<T, ValueDict>) {
                return Difference{diff(lhs, *b.get_if<T>())};
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                const auto& rhs = *b.get_if<ValueVector>();
                return Difference{diff(lhs, rhs, positional_values(lhs.size()), positional_values(rhs.size()))};
            } else if constexpr (std::is_same_v<T, ValueMatrix>) {
                const auto& rhs = *b.get_if<ValueMatrix>();
                return Difference{diff(lhs, rhs, positional_values(lhs.rows()), positional_values(lhs.cols()),
                                       positional_values(rhs.rows()), positional_values(rhs.cols()))};
            } else {
                // Scalars were rejected above
                detail::raise<ArgumentError>("diff", "value is not diffable");
            }
        },
        a.data);
}

Difference diff(const Value& a, const Value& b, const Vector<Value>& ia, const Vector<Value>& ib)
{
    auto* lhs = a.get_if<ValueVector>();
    auto* rhs = b.get_if<ValueVector>();
    if (!lhs || !rhs) {
        kind_error("diff(vector)", "vector", a, b);
    }
    return Difference{diff(*lhs, *rhs, ia, ib)};
}

Difference diff(const Value& a,
                const Value& b,
                const Vector<Value>& ia,
                const Vector<Value>& ja,
                const Vector<Value>& ib,
                const Vector<Value>& jb)
{
    auto* lhs = a.get_if<ValueMatrix>();
    auto* rhs = b.get_if<ValueMatrix>();
    if (!lhs || !rhs) {
        kind_error("diff(matrix)", "matrix", a, b);
    }
    return Difference{diff(*lhs, *rhs, ia, ja, ib, jb)};
}

} // namespace structdiff
