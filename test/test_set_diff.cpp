// test_set_diff.cpp - Tests for set differences
// Typed Set<T> and dynamic ValueSet

#include <catch2/catch_all.hpp>
#include <structdiff/structdiff.h>

#include <initializer_list>
#include <string>

using namespace structdiff;

// ============================================================
// Helper Functions
// ============================================================

template <typename T>
Set<T> make_set(std::initializer_list<T> elements) {
    auto t = Set<T>{}.transient();
    for (const auto& e : elements) {
        t.insert(e);
    }
    return t.persistent();
}

// ============================================================
// Typed sets
// ============================================================

TEST_CASE("Set diff partitions", "[set]") {
    auto d = diff(make_set({1, 2, 3}), make_set({2, 3, 4}));

    REQUIRE(d.common() == make_set({2, 3}));
    REQUIRE(d.added() == make_set({4}));
    REQUIRE(d.removed() == make_set({1}));
}

TEST_CASE("Set diff with duplicates collapsed", "[set]") {
    auto d = diff(make_set({1, 2, 3, 3}), make_set({4, 2, 1}));

    REQUIRE(common(d) == make_set({1, 2}));
    REQUIRE(added(d) == make_set({4}));
    REQUIRE(removed(d) == make_set({3}));
}

TEST_CASE("Set diff boundaries", "[set]") {
    SECTION("empty old set") {
        auto d = diff(Set<int>{}, make_set({5, 6}));
        REQUIRE(d.common().empty());
        REQUIRE(d.added() == make_set({5, 6}));
        REQUIRE(d.removed().empty());
    }

    SECTION("empty new set") {
        auto d = diff(make_set({5, 6}), Set<int>{});
        REQUIRE(d.common().empty());
        REQUIRE(d.added().empty());
        REQUIRE(d.removed() == make_set({5, 6}));
    }

    SECTION("identical sets") {
        auto s = make_set<std::string>({"a", "b"});
        auto d = diff(s, s);
        REQUIRE(d.common() == s);
        REQUIRE(d.added().empty());
        REQUIRE(d.removed().empty());
    }

    SECTION("larger old set") {
        auto d = diff(make_set({1, 2, 3, 4, 5, 6}), make_set({6, 7}));
        REQUIRE(d.common() == make_set({6}));
        REQUIRE(d.added() == make_set({7}));
        REQUIRE(d.removed() == make_set({1, 2, 3, 4, 5}));
    }
}

TEST_CASE("SetDifference equality", "[set]") {
    SetDifference<int> a{make_set({1}), make_set({2}), make_set({3})};
    SetDifference<int> b{make_set({1}), make_set({2}), make_set({3})};
    SetDifference<int> c{make_set({1}), make_set({3}), make_set({2})};

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
}

// ============================================================
// Dynamic sets
// ============================================================

TEST_CASE("Value set diff", "[set][dispatch]") {
    auto d = diff(Value::set({1, 2, 3}), Value::set({2, 3, 4}));

    REQUIRE(d.kind() == DiffKind::Set);
    auto* sd = d.get_if<ValueSetDifference>();
    REQUIRE(sd != nullptr);
    REQUIRE(sd->common() == *Value::set({2, 3}).get_if<ValueSet>());
    REQUIRE(sd->added() == *Value::set({4}).get_if<ValueSet>());
    REQUIRE(sd->removed() == *Value::set({1}).get_if<ValueSet>());
}

TEST_CASE("Value set diff distinguishes element kinds", "[set][dispatch]") {
    // 1 and 1.0 are different elements
    auto d = diff(Value::set({1, "x"}), Value::set({1.0, "x"}));
    auto* sd = d.get_if<ValueSetDifference>();
    REQUIRE(sd != nullptr);

    REQUIRE(sd->common() == *Value::set({"x"}).get_if<ValueSet>());
    REQUIRE(sd->added() == *Value::set({1.0}).get_if<ValueSet>());
    REQUIRE(sd->removed() == *Value::set({1}).get_if<ValueSet>());
}
