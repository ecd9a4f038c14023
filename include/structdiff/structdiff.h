// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file structdiff.h
/// @brief Convenience header pulling in the whole structdiff API.
///
/// - Typed layer:   diff() over Set<T>, Vector<T>, Matrix<T> (container_diff.h)
/// - Dynamic layer: diff() over Value, returning Difference (value_diff.h)
/// - Display:       to_string(), operator<< (display.h)
///
/// lager integration lives in <structdiff/lager_adapters.h> and is not
/// included here.

#pragma once

#include <structdiff/structdiff_config.h>
#include <structdiff/api.h>
#include <structdiff/errors.h>
#include <structdiff/containers.h>
#include <structdiff/value.h>
#include <structdiff/builders.h>
#include <structdiff/alignment.h>
#include <structdiff/difference.h>
#include <structdiff/container_diff.h>
#include <structdiff/value_diff.h>
#include <structdiff/display.h>
