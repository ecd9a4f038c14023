// display.cpp - Text rendering of dynamic differences

#include <structdiff/display.h>

namespace structdiff {

namespace {

/// {name: value, ...} in the given order
template <typename Range>
void write_fields(std::ostream& os, const Range& fields)
{
    os << "{";
    bool first = true;
    for (const auto& f : fields) {
        if (!first) os << ", ";
        os << f.name << ": ";
        detail::write_element(os, f.value);
        first = false;
    }
    os << "}";
}

/// {key: value, ...} sorted by key
template <typename MapT>
void write_entries(std::ostream& os, const MapT& entries)
{
    std::vector<std::pair<std::string, std::string>> parts;
    for (const auto& [key, value] : entries) {
        parts.emplace_back(key, detail::element_string(value));
    }
    std::sort(parts.begin(), parts.end());
    os << "{";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) os << ", ";
        os << parts[i].first << ": " << parts[i].second;
    }
    os << "}";
}

template <typename Diff>
void write_compact_indexed(std::ostream& os, std::string_view name, const Diff& d)
{
    os << name << "(modified: ";
    detail::write_sequence(os, d.modified());
    os << ", added: ";
    detail::write_sequence(os, d.added());
    os << ", removed: ";
    detail::write_sequence(os, d.removed());
    os << ")";
}

} // anonymous namespace

std::string to_string(const Delta& delta)
{
    if (auto* v = delta.value()) return value_to_string(*v);
    return to_compact_string(*delta.difference());
}

std::string to_string(const RecordDifference& d)
{
    std::ostringstream oss;
    oss << "RecordDifference with values:\n modified: ";
    write_fields(oss, d.modified());
    oss << "\n added: ";
    write_fields(oss, d.added());
    oss << "\n removed: ";
    write_fields(oss, d.removed());
    return oss.str();
}

std::string to_string(const DictDifference& d)
{
    std::ostringstream oss;
    oss << "DictDifference with values:\n modified: ";
    write_entries(oss, d.modified());
    oss << "\n added: ";
    write_entries(oss, d.added());
    oss << "\n removed: ";
    write_entries(oss, d.removed());
    return oss.str();
}

std::string to_string(const Difference& d)
{
    return std::visit([](const auto& arg) { return to_string(arg); }, d.data);
}

std::string to_compact_string(const Difference& d)
{
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, ValueSetDifference>) {
                oss << "SetDifference(common: ";
                detail::write_set(oss, arg.common());
                oss << ", added: ";
                detail::write_set(oss, arg.added());
                oss << ", removed: ";
                detail::write_set(oss, arg.removed());
                oss << ")";
            } else if constexpr (std::is_same_v<T, ValueVectorDifference>) {
                write_compact_indexed(oss, "VectorDifference", arg);
            } else if constexpr (std::is_same_v<T, ValueMatrixDifference>) {
                write_compact_indexed(oss, "MatrixDifference", arg);
            } else if constexpr (std::is_same_v<T, RecordDifference>) {
                oss << "RecordDifference(modified: ";
                write_fields(oss, arg.modified());
                oss << ", added: ";
                write_fields(oss, arg.added());
                oss << ", removed: ";
                write_fields(oss, arg.removed());
                oss << ")";
            } else {
                oss << "DictDifference(modified: ";
                write_entries(oss, arg.modified());
                oss << ", added: ";
                write_entries(oss, arg.added());
                oss << ", removed: ";
                write_entries(oss, arg.removed());
                oss << ")";
            }
        },
        d.data);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Difference& d)
{
    return os << to_string(d);
}

} // namespace structdiff
