// test_lager_adapters.cpp - Tests for store middleware and watchers
// diff_middleware with a manual event loop, watch_diff on lager::state

#include <catch2/catch_all.hpp>
#include <structdiff/lager_adapters.h>
#include <structdiff/structdiff.h>

#include <lager/event_loop/manual.hpp>
#include <lager/state.hpp>
#include <lager/store.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace structdiff;

// ============================================================
// Test Store
// ============================================================

namespace {

struct SetCount {
    int64_t value;
};
struct Rename {
    std::string name;
};
struct Touch {};
struct Replace {
    Value model;
};

using Action = std::variant<SetCount, Rename, Touch, Replace>;

Value update(Value model, Action action)
{
    return std::visit(
        [&](auto&& act) -> Value {
            using T = std::decay_t<decltype(act)>;
            if constexpr (std::is_same_v<T, SetCount>) {
                return RecordBuilder(*model.get_if<ValueRecord>()).set("count", act.value).finish();
            } else if constexpr (std::is_same_v<T, Rename>) {
                return RecordBuilder(*model.get_if<ValueRecord>()).set("name", act.name).finish();
            } else if constexpr (std::is_same_v<T, Replace>) {
                return act.model;
            } else {
                return model;
            }
        },
        action);
}

Value initial_model()
{
    return Value::record({{"count", 0}, {"name", Value::set({"a"})}});
}

struct Recorder {
    std::vector<Difference> diffs;
    std::vector<std::string> errors;

    DiffMiddlewareConfig config()
    {
        return {
            .on_diff = [this](const Value&, const Value&, const Difference& d) { diffs.push_back(d); },
            .on_error = [this](const Value&, const Value&, const DiffError& e) { errors.emplace_back(e.what()); },
        };
    }
};

} // namespace

// ============================================================
// diff_middleware
// ============================================================

TEST_CASE("diff_middleware reports each change", "[lager][middleware]") {
    Recorder recorder;
    auto store = lager::make_store<Action>(initial_model(), lager::with_manual_event_loop{},
                                           lager::with_reducer(update), diff_middleware(recorder.config()));

    store.dispatch(SetCount{5});

    REQUIRE(store.get().field("count") == Value{5});
    REQUIRE(recorder.diffs.size() == 1);
    REQUIRE(recorder.errors.empty());

    auto* rd = recorder.diffs[0].get_if<RecordDifference>();
    REQUIRE(rd != nullptr);
    REQUIRE(rd->modified().size() == 2);
    REQUIRE(*find_field(rd->modified(), "count")->value() == Value{5});

    store.dispatch(SetCount{2});
    REQUIRE(recorder.diffs.size() == 2);
    REQUIRE(*find_field(recorder.diffs[1].get_if<RecordDifference>()->modified(), "count")->value() == Value{-3});
}

TEST_CASE("diff_middleware is silent when nothing changes", "[lager][middleware]") {
    Recorder recorder;
    auto store = lager::make_store<Action>(initial_model(), lager::with_manual_event_loop{},
                                           lager::with_reducer(update), diff_middleware(recorder.config()));

    store.dispatch(Touch{});
    store.dispatch(SetCount{0});

    REQUIRE(recorder.diffs.empty());
    REQUIRE(recorder.errors.empty());
}

TEST_CASE("diff_middleware routes diff failures to on_error", "[lager][middleware][error]") {
    Recorder recorder;
    auto store = lager::make_store<Action>(initial_model(), lager::with_manual_event_loop{},
                                           lager::with_reducer(update), diff_middleware(recorder.config()));

    SECTION("field changes type") {
        store.dispatch(Rename{"b"});
        REQUIRE(recorder.diffs.empty());
        REQUIRE(recorder.errors.size() == 1);
        REQUIRE_THAT(recorder.errors[0], Catch::Matchers::ContainsSubstring("name"));
    }

    SECTION("model changes kind") {
        store.dispatch(Replace{Value::vector({1})});
        REQUIRE(recorder.errors.size() == 1);
        // The transition itself still happens
        REQUIRE(store.get() == Value::vector({1}));
    }
}

TEST_CASE("diff_middleware without callbacks", "[lager][middleware]") {
    auto store = lager::make_store<Action>(initial_model(), lager::with_manual_event_loop{},
                                           lager::with_reducer(update), diff_middleware());

    REQUIRE_NOTHROW(store.dispatch(SetCount{1}));
    REQUIRE_NOTHROW(store.dispatch(Replace{Value{"scalar"}}));
    REQUIRE(store.get() == Value{"scalar"});
}

TEST_CASE("diff_middleware lets on_diff exceptions through", "[lager][middleware][error]") {
    std::vector<std::string> errors;
    DiffMiddlewareConfig config{
        .on_diff = [](const Value&, const Value&, const Difference&) {
            throw ArgumentError("rejected by listener");
        },
        .on_error = [&](const Value&, const Value&, const DiffError& e) { errors.emplace_back(e.what()); },
    };

    auto before = initial_model();
    auto after = RecordBuilder(*before.get_if<ValueRecord>()).set("count", 3).finish();

    REQUIRE_THROWS_AS(detail::report_transition(config, before, after), ArgumentError);
    REQUIRE(errors.empty());

    // Diff failures still go to on_error and never reach on_diff
    REQUIRE_NOTHROW(detail::report_transition(config, before, Value::vector({1})));
    REQUIRE(errors.size() == 1);
}

// ============================================================
// watch_diff
// ============================================================

TEST_CASE("watch_diff reports differences against the previous value", "[lager][watch]") {
    auto state = lager::make_state(Value::vector({1, 2}), lager::automatic_tag{});

    std::vector<Difference> seen;
    watch_diff(state, [&](const Difference& d) { seen.push_back(d); });

    state.set(Value::vector({1, 5, 7}));
    REQUIRE(seen.size() == 1);

    auto* vd = seen[0].get_if<ValueVectorDifference>();
    REQUIRE(vd != nullptr);
    REQUIRE(vd->added_indices() == Vector<Value>{3});
    REQUIRE(vd->modified() == Vector<Delta>{Delta{Value{0}}, Delta{Value{3}}});

    SECTION("baseline moves with each change") {
        state.set(Value::vector({1, 5}));
        REQUIRE(seen.size() == 2);
        auto* second = seen[1].get_if<ValueVectorDifference>();
        REQUIRE(second->removed_indices() == Vector<Value>{3});
        REQUIRE(second->modified() == Vector<Delta>{Delta{Value{0}}, Delta{Value{0}}});
    }

    SECTION("undiffable changes are skipped") {
        state.set(Value{"not a container"});
        REQUIRE(seen.size() == 1);

        state.set(Value::vector({2}));
        REQUIRE(seen.size() == 1);

        state.set(Value::vector({4}));
        REQUIRE(seen.size() == 2);
    }
}

TEST_CASE("watch_diff lets callback exceptions through", "[lager][watch][error]") {
    auto state = lager::make_state(Value::vector({1, 2}), lager::automatic_tag{});

    int calls = 0;
    watch_diff(state, [&](const Difference&) {
        ++calls;
        throw ArgumentError("rejected by listener");
    });

    REQUIRE_THROWS_AS(state.set(Value::vector({1, 3})), ArgumentError);
    REQUIRE(calls == 1);
}
