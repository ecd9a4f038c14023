// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file hashing.h
/// @brief Helpers for the boost::hash / hash_value protocol.
///
/// structdiff types expose `hash_value` overloads found through ADL, so
/// `boost::hash<T>` works for every value and difference type. Sequences
/// hash in order; sets and maps hash independently of iteration order.

#pragma once

#include <structdiff/structdiff_config.h>

#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <variant>

namespace structdiff::detail {

template <typename T>
[[nodiscard]] std::size_t hash_element(const T& v)
{
    if constexpr (std::is_same_v<T, std::monostate>) {
        return 0;
    } else {
        return boost::hash<T>{}(v);
    }
}

/// Order-dependent hash of a range
template <typename Range>
[[nodiscard]] std::size_t hash_ordered(const Range& range, std::size_t seed = 0)
{
    for (const auto& element : range) {
        boost::hash_combine(seed, hash_element(element));
    }
    return seed;
}

/// Order-independent hash of a range (sets, hash maps)
template <typename Range>
[[nodiscard]] std::size_t hash_unordered(const Range& range, std::size_t seed = 0)
{
    std::size_t sum = 0;
    for (const auto& element : range) {
        sum += hash_element(element);
    }
    boost::hash_combine(seed, sum);
    return seed;
}

/// Seed derived from a type name, so equal payloads of different kinds differ
[[nodiscard]] inline std::size_t hash_tag(std::string_view tag)
{
    return boost::hash_range(tag.begin(), tag.end());
}

} // namespace structdiff::detail
