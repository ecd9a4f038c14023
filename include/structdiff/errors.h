// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types and diagnostic logging for structdiff.
///
/// Every failure is a caller input-contract violation detected before a
/// difference value is returned:
/// - ArgumentError: malformed identifiers, mismatched or non-diffable kinds
/// - TypeMismatch:  a common record/dict field whose values cannot be diffed

#pragma once

#include <structdiff/structdiff_config.h>
#include <structdiff/api.h>

#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace structdiff {

/// Base class of all errors raised by structdiff
class DiffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed arguments: identifier length/uniqueness, container kinds
class ArgumentError : public DiffError {
public:
    using DiffError::DiffError;
};

/// A field present on both sides holds values that cannot be diffed
class TypeMismatch : public DiffError {
public:
    using DiffError::DiffError;
};

namespace detail {

inline void log_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCTDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCTDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCTDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Log the failure, then throw it
template <typename Error>
[[noreturn]] void raise(std::string_view func,
                        const std::string& message,
                        std::source_location loc = std::source_location::current())
{
    log_error(func, message, loc);
    throw Error(std::string(func) + ": " + message);
}

} // namespace detail

} // namespace structdiff
