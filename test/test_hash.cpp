// test_hash.cpp - Tests for equality and hashing of values and differences
// boost::hash / hash_value protocol and std::hash specializations

#include <catch2/catch_all.hpp>
#include <structdiff/structdiff.h>

#include <boost/container_hash/hash.hpp>

#include <unordered_set>

using namespace structdiff;

TEST_CASE("Value hashing", "[hash][value]") {
    SECTION("equal values hash equally") {
        REQUIRE(hash_value(Value{1}) == hash_value(Value{1}));
        REQUIRE(boost::hash<Value>{}(Value::vector({1, 2})) == boost::hash<Value>{}(Value::vector({1, 2})));
        REQUIRE(std::hash<Value>{}(Value{"a"}) == std::hash<Value>{}(Value{"a"}));
    }

    SECTION("set and dict hashes ignore insertion order") {
        REQUIRE(hash_value(Value::set({1, 2, 3})) == hash_value(Value::set({3, 1, 2})));
        REQUIRE(hash_value(Value::dict({{"a", 1}, {"b", 2}})) == hash_value(Value::dict({{"b", 2}, {"a", 1}})));
    }

    SECTION("kind takes part in the hash") {
        REQUIRE(hash_value(Value{1}) != hash_value(Value{2}));
        REQUIRE(hash_value(Value::vector({})) != hash_value(Value::set({})));
    }

    SECTION("values work as unordered_set keys") {
        std::unordered_set<Value> seen;
        seen.insert(Value::record({{"a", 1}}));
        seen.insert(Value::record({{"a", 1}}));
        seen.insert(Value::record({{"a", 2}}));
        REQUIRE(seen.size() == 2);
    }
}

TEST_CASE("Typed difference equality and hashing", "[hash]") {
    auto a = diff(Vector<int>{1, 2, 3}, Vector<int>{1, 4});
    auto b = diff(Vector<int>{1, 2, 3}, Vector<int>{1, 4});
    auto c = diff(Vector<int>{1, 2, 3}, Vector<int>{1, 5});

    REQUIRE(a == b);
    REQUIRE(boost::hash<decltype(a)>{}(a) == boost::hash<decltype(b)>{}(b));
    REQUIRE_FALSE(a == c);

    auto m1 = diff(Matrix<int>{{1, 2}}, Matrix<int>{{1, 3}});
    auto m2 = diff(Matrix<int>{{1, 2}}, Matrix<int>{{1, 3}});
    REQUIRE(m1 == m2);
    REQUIRE(hash_value(m1) == hash_value(m2));
}

TEST_CASE("Difference equality and hashing", "[hash]") {
    auto rec_a = Value::record({{"a", 1}, {"b", Value::vector({1, 2})}});
    auto rec_b = Value::record({{"b", Value::vector({1, 3})}, {"c", 4}});

    auto d1 = diff(rec_a, rec_b);
    auto d2 = diff(rec_a, rec_b);

    REQUIRE(d1 == d2);
    REQUIRE(hash_value(d1) == hash_value(d2));
    REQUIRE(std::hash<Difference>{}(d1) == std::hash<Difference>{}(d2));

    SECTION("different differences compare unequal") {
        auto d3 = diff(rec_b, rec_a);
        REQUIRE_FALSE(d1 == d3);
    }

    SECTION("set differences compare by partition") {
        auto s1 = diff(Value::set({1, 2}), Value::set({2, 3}));
        auto s2 = diff(Value::set({2, 1}), Value::set({3, 2}));
        REQUIRE(s1 == s2);
        REQUIRE(hash_value(s1) == hash_value(s2));
        REQUIRE_FALSE(s1 == diff(Value::set({2, 3}), Value::set({1, 2})));
    }

    SECTION("dict differences ignore key order") {
        auto x = diff(Value::dict({{"a", 1}, {"b", 2}}), Value::dict({{"a", 2}}));
        auto y = diff(Value::dict({{"b", 2}, {"a", 1}}), Value::dict({{"a", 2}}));
        REQUIRE(x == y);
        REQUIRE(hash_value(x) == hash_value(y));
    }

    SECTION("differences of different kinds are unequal") {
        auto v = diff(Value::vector({1}), Value::vector({1}));
        auto s = diff(Value::set({1}), Value::set({1}));
        REQUIRE_FALSE(v == s);
    }
}

TEST_CASE("Delta equality", "[hash]") {
    Delta null_delta;
    Delta number{Value{1}};
    Delta nested{diff(Value::vector({1}), Value::vector({2}))};

    REQUIRE(null_delta == Delta{Value{}});
    REQUIRE(number == Delta{Value{1}});
    REQUIRE_FALSE(number == Delta{Value{1.0}});
    REQUIRE_FALSE(number == nested);
    REQUIRE(nested == Delta{diff(Value::vector({1}), Value::vector({2}))});
    REQUIRE(hash_value(nested) == hash_value(Delta{diff(Value::vector({1}), Value::vector({2}))}));
}
