// main.cpp - Structural Diff Example

#include <structdiff/lager_adapters.h>
#include <structdiff/structdiff.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <iostream>
#include <string>
#include <variant>

using namespace structdiff;

// ============================================================
// Application State and Actions
// ============================================================

struct MoveBy
{
    double dx;
    double dy;
};

struct AddTag
{
    std::string tag;
};

struct RemoveTag
{
    std::string tag;
};

using Action = std::variant<MoveBy, AddTag, RemoveTag>;

Value create_initial_state()
{
    return RecordBuilder()
        .set("position", Value::record({{"x", 0.0}, {"y", 0.0}}))
        .set("tags", Value::set({"visible"}))
        .set("samples", Value::vector({1, 2, 3}))
        .finish();
}

// ============================================================
// Reducer
// ============================================================

Value reducer(Value state, Action action)
{
    const auto& fields = *state.get_if<ValueRecord>();

    return std::visit(
        [&](auto&& act) -> Value {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, MoveBy>) {
                return RecordBuilder(fields)
                    .update("position",
                            [&](const Value& pos) {
                                return Value::record({{"x", pos.field("x").as_double() + act.dx},
                                                      {"y", pos.field("y").as_double() + act.dy}});
                            })
                    .finish();

            } else if constexpr (std::is_same_v<T, AddTag>) {
                return RecordBuilder(fields)
                    .update("tags",
                            [&](const Value& tags) {
                                return SetBuilder(*tags.get_if<ValueSet>()).insert(act.tag).finish();
                            })
                    .finish();

            } else if constexpr (std::is_same_v<T, RemoveTag>) {
                return RecordBuilder(fields)
                    .update("tags",
                            [&](const Value& tags) {
                                return Value{tags.get_if<ValueSet>()->erase(ValueBox{Value{act.tag}})};
                            })
                    .finish();
            }

            return state;
        },
        action);
}

// ============================================================
// Standalone diffs
// ============================================================

void demo_containers()
{
    std::cout << "=== Sets ===\n";
    std::cout << to_string(diff(Value::set({1, 2, 3}), Value::set({2, 3, 4}))) << "\n\n";

    std::cout << "=== Vectors aligned by identifier ===\n";
    auto ids_old = Vector<Value>{"a", "b", "c"};
    auto ids_new = Vector<Value>{"b", "c", "d", "e"};
    std::cout << to_string(diff(Value::vector({10, 20, 30}), Value::vector({99, 20, 30, 40}), ids_old, ids_new))
              << "\n\n";

    std::cout << "=== Matrices ===\n";
    std::cout << to_string(diff(Value::matrix({{1, 2}, {3, 4}}), Value::matrix({{1, 2, 5}, {3, 6, 7}, {8, 9, 10}})))
              << "\n\n";

    std::cout << "=== Nested records ===\n";
    auto before = Value::record({{"pos", Value::record({{"x", 1}, {"y", 2}})}, {"name", Value::set({"a"})}});
    auto after = Value::record({{"pos", Value::record({{"x", 4}, {"y", 2}})}, {"name", Value::set({"b"})}});
    print_value(before, "", 1);
    print_value(after, "", 1);
    std::cout << to_string(diff(before, after)) << "\n\n";

    std::cout << "=== Mismatched kinds ===\n";
    try {
        auto ignored = diff(Value::vector({1}), Value::set({1}));
        (void)ignored;
    } catch (const DiffError& e) {
        std::cout << "error: " << e.what() << "\n\n";
    }
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    demo_containers();

    std::cout << "=== Store with diff_logging_middleware ===\n";
    auto store = lager::make_store<Action>(create_initial_state(), lager::with_manual_event_loop{},
                                           lager::with_reducer(reducer), diff_logging_middleware());

    store.dispatch(MoveBy{1.5, -2.0});
    store.dispatch(AddTag{"selected"});
    store.dispatch(RemoveTag{"visible"});

    std::cout << "\nFinal state:\n";
    print_value(store.get(), "", 1);
    return 0;
}
