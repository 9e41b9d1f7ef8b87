/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for pipeflow interfaces.
 *
 * Compile-time contracts for objects crossing the authoring boundary, so
 * callers can hand the core their own task types without inheriting from
 * a pipeflow base class.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <ranges>
#include <string_view>

namespace pipeflow {

// ─────────────────────────────────────────────
// TaskDescriptorLike
// ─────────────────────────────────────────────

/**
 * @concept TaskDescriptorLike
 * @brief Constrains types that describe a unit of work.
 *
 * Any type exposing an analysis name, a command, input and output path
 * ranges and a Resources value can be queued.
 */
template <typename T>
concept TaskDescriptorLike = requires(const T& task) {
    { task.analysis_name() } -> std::convertible_to<std::string_view>;
    { task.command() } -> std::convertible_to<std::string_view>;
    { task.inputs() } -> std::ranges::input_range;
    { task.outputs() } -> std::ranges::input_range;
    { task.resources() } -> std::convertible_to<Resources>;
};

}  // namespace pipeflow
