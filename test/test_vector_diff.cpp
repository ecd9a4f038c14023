// test_vector_diff.cpp - Tests for vector differences
// Positional and identifier-aligned diffs, typed and dynamic

#include <catch2/catch_all.hpp>
#include <structdiff/structdiff.h>

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <variant>

using namespace structdiff;

// ============================================================
// Typed vectors
// ============================================================

TEST_CASE("Vector diff by identifiers", "[vector]") {
    Vector<int> a{10, 20, 30};
    Vector<int> b{99, 20, 30, 40};

    auto d = diff(a, b, Vector<int>{1, 2, 3}, Vector<int>{2, 3, 4, 5});

    SECTION("indices") {
        REQUIRE(d.modified_indices() == Vector<int>{2, 3});
        REQUIRE(d.added_indices() == Vector<int>{4, 5});
        REQUIRE(d.removed_indices() == Vector<int>{1});
    }

    SECTION("values follow the identifiers, delta is new - old") {
        // id 2: old 20, new 99; id 3: old 30, new 20
        REQUIRE(d.modified() == Vector<int>{79, -10});
        REQUIRE(d.added() == Vector<int>{30, 40});
        REQUIRE(d.removed() == Vector<int>{10});
    }
}

TEST_CASE("Vector diff by position", "[vector]") {
    auto d = diff(Vector<int>{1, 2, 3}, Vector<int>{1, 5});

    REQUIRE(d.modified_indices() == Vector<std::size_t>{1, 2});
    REQUIRE(d.modified() == Vector<int>{0, 3});
    REQUIRE(d.added_indices().empty());
    REQUIRE(d.added().empty());
    REQUIRE(d.removed_indices() == Vector<std::size_t>{3});
    REQUIRE(d.removed() == Vector<int>{3});
}

TEST_CASE("Vector diff with real elements", "[vector]") {
    auto d = diff(Vector<double>{1.5, 2.0}, Vector<double>{2.0, 2.0, 0.5});

    REQUIRE(d.modified() == Vector<double>{0.5, 0.0});
    REQUIRE(d.added() == Vector<double>{0.5});
    REQUIRE(d.added_indices() == Vector<std::size_t>{3});
}

TEST_CASE("Vector diff integer deltas wrap at the type limits", "[vector]") {
    SECTION("int") {
        constexpr int lo = std::numeric_limits<int>::min();
        constexpr int hi = std::numeric_limits<int>::max();
        auto d = diff(Vector<int>{lo, hi, 0}, Vector<int>{hi, lo, 7});
        REQUIRE(d.modified() == Vector<int>{-1, 1, 7});
    }

    SECTION("int64_t") {
        constexpr int64_t lo = std::numeric_limits<int64_t>::min();
        constexpr int64_t hi = std::numeric_limits<int64_t>::max();
        auto d = diff(Vector<int64_t>{lo, hi - 1}, Vector<int64_t>{1, hi});
        STATIC_REQUIRE(std::is_same_v<decltype(d)::delta_type, int64_t>);
        REQUIRE(d.modified() == Vector<int64_t>{lo + 1, 1});
    }
}

TEST_CASE("Vector diff of non-subtractable elements", "[vector]") {
    auto d = diff(Vector<std::string>{"a", "b"}, Vector<std::string>{"a", "c", "d"});

    // Positions only; deltas carry no information
    STATIC_REQUIRE(std::is_same_v<decltype(d)::delta_type, std::monostate>);
    REQUIRE(d.modified_indices() == Vector<std::size_t>{1, 2});
    REQUIRE(d.modified().size() == 2);
    REQUIRE(d.added() == Vector<std::string>{"d"});
    REQUIRE(d.removed().empty());
}

TEST_CASE("Vector diff with an empty side", "[vector]") {
    SECTION("empty old vector") {
        auto d = diff(Vector<int>{}, Vector<int>{7, 8}, Vector<int>{}, Vector<int>{3, 4});
        REQUIRE(d.modified_indices().empty());
        REQUIRE(d.modified().empty());
        REQUIRE(d.added_indices() == Vector<int>{3, 4});
        REQUIRE(d.added() == Vector<int>{7, 8});
        REQUIRE(d.removed_indices().empty());
        REQUIRE(d.removed().empty());
    }

    SECTION("empty new vector") {
        auto d = diff(Vector<int>{7, 8}, Vector<int>{});
        REQUIRE(d.modified().empty());
        REQUIRE(d.added().empty());
        REQUIRE(d.removed_indices() == Vector<std::size_t>{1, 2});
        REQUIRE(d.removed() == Vector<int>{7, 8});
    }

    SECTION("both empty") {
        auto d = diff(Vector<int>{}, Vector<int>{});
        REQUIRE(d == VectorDifference<int>{});
    }

    SECTION("identifiers are still validated") {
        REQUIRE_THROWS_AS(diff(Vector<int>{}, Vector<int>{1, 2}, Vector<int>{}, Vector<int>{5, 5}),
                          ArgumentError);
        REQUIRE_THROWS_AS(diff(Vector<int>{}, Vector<int>{1, 2}, Vector<int>{1}, Vector<int>{5, 6}),
                          ArgumentError);
    }
}

TEST_CASE("Vector diff rejects bad identifiers", "[vector][error]") {
    Vector<int> a{1, 2};
    Vector<int> b{1, 2, 3};

    SECTION("old identifiers too short") {
        REQUIRE_THROWS_AS(diff(a, b, Vector<int>{1}, Vector<int>{1, 2, 3}), ArgumentError);
    }

    SECTION("new identifiers too long") {
        REQUIRE_THROWS_AS(diff(a, b, Vector<int>{1, 2}, Vector<int>{1, 2, 3, 4}), ArgumentError);
    }

    SECTION("duplicate identifiers") {
        REQUIRE_THROWS_AS(diff(a, b, Vector<int>{1, 1}, Vector<int>{1, 2, 3}), ArgumentError);
        REQUIRE_THROWS_AS(diff(a, b, Vector<int>{1, 2}, Vector<int>{1, 3, 3}), ArgumentError);
    }
}

TEST_CASE("VectorDifference checks partition lengths", "[vector][error]") {
    REQUIRE_NOTHROW(VectorDifference<int>{{3}, {1}, {2}, {-1}, {3}, {4}});
    REQUIRE_THROWS_AS((VectorDifference<int>{{3}, {1}, {2}, {-1, 0}, {3}, {4}}), ArgumentError);
    REQUIRE_THROWS_AS((VectorDifference<int>{{3}, {1}, {2}, {-1}, {}, {4}}), ArgumentError);
}

// ============================================================
// Dynamic vectors
// ============================================================

TEST_CASE("Value vector diff by identifiers", "[vector][dispatch]") {
    auto a = Value::vector({10, 20, 30});
    auto b = Value::vector({99, 20, 30, 40});

    auto d = diff(a, b, Vector<Value>{1, 2, 3}, Vector<Value>{2, 3, 4, 5});
    auto* vd = d.get_if<ValueVectorDifference>();
    REQUIRE(vd != nullptr);

    REQUIRE(vd->modified_indices() == Vector<Value>{2, 3});
    REQUIRE(vd->modified() == Vector<Delta>{Delta{Value{79}}, Delta{Value{-10}}});
    REQUIRE(vd->added_indices() == Vector<Value>{4, 5});
    REQUIRE(vd->added() == *Value::vector({30, 40}).get_if<ValueVector>());
    REQUIRE(vd->removed_indices() == Vector<Value>{1});
    REQUIRE(vd->removed() == *Value::vector({10}).get_if<ValueVector>());
}

TEST_CASE("Value vector diff with string identifiers", "[vector][dispatch]") {
    auto a = Value::vector({1.0, 2.0});
    auto b = Value::vector({2.5, 1.0});

    auto d = diff(a, b, Vector<Value>{"x", "y"}, Vector<Value>{"y", "x"});
    auto* vd = d.get_if<ValueVectorDifference>();
    REQUIRE(vd != nullptr);

    REQUIRE(vd->modified_indices() == Vector<Value>{"x", "y"});
    REQUIRE(*vd->modified()[0].value() == Value{0.0});
    REQUIRE(*vd->modified()[1].value() == Value{0.5});
}

TEST_CASE("Value vector element deltas", "[vector][dispatch]") {
    SECTION("integer minus integer stays integer") {
        auto d = diff(Value::vector({1}), Value::vector({4}));
        REQUIRE(*d.get_if<ValueVectorDifference>()->modified()[0].value() == Value{3});
    }

    SECTION("mixed numbers become real") {
        auto d = diff(Value::vector({1}), Value::vector({1.5}));
        REQUIRE(*d.get_if<ValueVectorDifference>()->modified()[0].value() == Value{0.5});
    }

    SECTION("non-numeric elements have a null delta") {
        auto d = diff(Value::vector({"a", true}), Value::vector({"b", false}));
        const auto& modified = d.get_if<ValueVectorDifference>()->modified();
        REQUIRE(modified.size() == 2);
        REQUIRE(modified[0].value()->is_null());
        REQUIRE(modified[1].value()->is_null());
    }

    SECTION("nested vectors diff recursively") {
        auto d = diff(Value::vector({Value::vector({1, 2})}), Value::vector({Value::vector({1, 3, 4})}));
        const auto& delta = d.get_if<ValueVectorDifference>()->modified()[0];
        REQUIRE(delta.is_difference());

        auto* nested = delta.difference()->get_if<ValueVectorDifference>();
        REQUIRE(nested != nullptr);
        REQUIRE(nested->modified() == Vector<Delta>{Delta{Value{0}}, Delta{Value{1}}});
        REQUIRE(nested->added() == *Value::vector({4}).get_if<ValueVector>());
    }
}

TEST_CASE("Value vector identifier errors", "[vector][dispatch][error]") {
    auto a = Value::vector({1, 2});
    auto b = Value::vector({1});

    REQUIRE_THROWS_AS(diff(a, b, Vector<Value>{1}, Vector<Value>{1}), ArgumentError);
    REQUIRE_THROWS_AS(diff(a, b, Vector<Value>{1, 1}, Vector<Value>{1}), ArgumentError);
    REQUIRE_THROWS_AS(diff(a, Value::set({1}), Vector<Value>{1, 2}, Vector<Value>{1}), ArgumentError);
}
