// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_adapters.h
/// @brief Store middleware and watchers that report state changes as Differences.
///
/// Features:
/// 1. diff_middleware() - lager store enhancer calling on_diff after each change
/// 2. diff_logging_middleware() - prints every change summary
/// 3. watch_diff() - watch a lager::reader<Value> / cursor<Value> for differences
///
/// Example usage:
/// @code
///   auto store = lager::make_store<Action>(
///       Value::record({{"count", 0}}),
///       lager::with_manual_event_loop{},
///       lager::with_reducer(update),
///       diff_middleware({.on_diff = [](const Value&, const Value&, const Difference& d) {
///           std::cout << d << "\n";
///       }}));
///
///   auto state = lager::make_state(Value::vector({1, 2}), lager::automatic_tag{});
///   watch_diff(state, [](const Difference& d) { ... });
/// @endcode

#pragma once

#include <structdiff/api.h>
#include <structdiff/display.h>
#include <structdiff/value.h>
#include <structdiff/value_diff.h>

#include <lager/reader.hpp>
#include <lager/watch.hpp>

#include <concepts>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace structdiff {

// ============================================================
// Part 1: diff_middleware - Store middleware
// ============================================================

/// Configuration for diff_middleware
struct DiffMiddlewareConfig {
    /// Called after a reducer step whose new model differs from the old one
    std::function<void(const Value& old_state, const Value& new_state, const Difference& d)> on_diff;

    /// Called when the two models cannot be diffed (different kinds, bad fields).
    /// Default: the error is logged and the transition is otherwise unaffected.
    std::function<void(const Value& old_state, const Value& new_state, const DiffError& e)> on_error;
};

namespace detail {

/// Diff one transition and route the result to the config callbacks
inline void report_transition(const DiffMiddlewareConfig& config, const Value& old_state, const Value& new_state)
{
    if (old_state == new_state) {
        return;
    }
    std::optional<Difference> d;
    try {
        d.emplace(diff(old_state, new_state));
    } catch (const DiffError& e) {
        if (config.on_error) {
            config.on_error(old_state, new_state, e);
        } else {
            log_error("diff_middleware", e.what());
        }
        return;
    }
    // Exceptions from on_diff propagate to the caller
    if (config.on_diff) {
        config.on_diff(old_state, new_state, *d);
    }
}

/// Internal: Creates the actual middleware enhancer
template <typename Config>
auto make_diff_middleware_impl(Config config)
{
    return [config = std::move(config)](auto next) {
        return [config, next](auto action, auto&& model, auto&& reducer, auto&& loop, auto&& deps, auto&& tags) {
            // Wrap the reducer to intercept state changes
            auto wrapped_reducer = [original_reducer = std::forward<decltype(reducer)>(reducer),
                                    config](auto&& state, auto&& act) {
                auto old_state = state;
                auto result = original_reducer(std::forward<decltype(state)>(state), std::forward<decltype(act)>(act));

                if constexpr (std::is_same_v<std::decay_t<decltype(old_state)>, Value>) {
                    // Reducers return either the model or a (model, effect) pair
                    if constexpr (requires { result.first; }) {
                        report_transition(config, old_state, result.first);
                    } else {
                        report_transition(config, old_state, result);
                    }
                }

                return result;
            };

            return next(action, std::forward<decltype(model)>(model), std::move(wrapped_reducer),
                        std::forward<decltype(loop)>(loop), std::forward<decltype(deps)>(deps),
                        std::forward<decltype(tags)>(tags));
        };
    };
}

} // namespace detail

/// Create a middleware for Value-based stores
/// @param config Callbacks for changes and diff failures
/// @return A store enhancer that can be passed to lager::make_store (after with_reducer)
[[nodiscard]] inline auto diff_middleware(DiffMiddlewareConfig config = {})
{
    return detail::make_diff_middleware_impl(std::move(config));
}

/// Middleware that prints every state change summary to std::cout
[[nodiscard]] inline auto diff_logging_middleware()
{
    return diff_middleware({.on_diff = [](const Value&, const Value&, const Difference& d) {
        std::cout << "[diff_logging_middleware] State changes detected:\n" << d << "\n";
    }});
}

// ============================================================
// Part 2: watch_diff - Watch adapter
// ============================================================

/// Watch a lager::reader<Value> or lager::cursor<Value> and report each
/// change as the Difference between the previously observed value and the
/// new one. Changes that cannot be diffed are logged and skipped; the
/// new value still becomes the baseline.
///
/// @param watchable A lager::reader<Value> or lager::cursor<Value>
/// @param callback Called with the Difference
/// @return Whatever lager::watch returns for this watchable
template <typename Watchable, typename Callback>
    requires std::is_same_v<typename Watchable::value_type, Value> &&
             std::invocable<Callback&, const Difference&>
decltype(auto) watch_diff(Watchable& watchable, Callback&& callback)
{
    auto previous = std::make_shared<Value>(watchable.get());
    return lager::watch(watchable, [previous, callback = std::forward<Callback>(callback)](const Value& current) mutable {
        if (*previous == current) {
            return;
        }
        std::optional<Difference> d;
        try {
            d.emplace(diff(*previous, current));
        } catch (const DiffError& e) {
            detail::log_error("watch_diff", e.what());
        }
        *previous = current;
        if (d) {
            callback(*d);
        }
    });
}

} // namespace structdiff
