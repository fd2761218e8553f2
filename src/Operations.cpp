/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/Operations.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <string_view>

namespace dqa {
namespace {
constexpr std::array<ArgumentSpec, 1> DELAY_ARGS{
    {{.name = "duration", .type = ArgumentType::NUMBER}}};
constexpr std::array<ArgumentSpec, 1> MEASURE_ARGS{
    {{.name = "key", .type = ArgumentType::STRING}}};
constexpr std::array<ArgumentSpec, 1> MEASURE_OPTIONAL_ARGS{
    {{.name = "feedback_key", .type = ArgumentType::STRING}}};
constexpr std::array<ArgumentSpec, 2> PRX_ARGS{
    {{.name = "angle", .type = ArgumentType::NUMBER},
     {.name = "phase", .type = ArgumentType::NUMBER}}};
constexpr std::array<ArgumentSpec, 4> CC_PRX_ARGS{
    {{.name = "angle", .type = ArgumentType::NUMBER},
     {.name = "phase", .type = ArgumentType::NUMBER},
     {.name = "feedback_qubit", .type = ArgumentType::STRING},
     {.name = "feedback_key", .type = ArgumentType::STRING}}};

// sorted by name
constexpr std::array NATIVE_OPERATIONS{
    NativeOperation{.name = "barrier",
                    .arity = 0,
                    .role = OperationRole::BARRIER,
                    .symmetric = true,
                    .noCalibrationNeeded = true},
    NativeOperation{.name = "cc_prx",
                    .arity = 1,
                    .role = OperationRole::CONDITIONAL_ROTATION,
                    .requiredArgs = CC_PRX_ARGS},
    NativeOperation{.name = "cz",
                    .arity = 2,
                    .role = OperationRole::TWO_QUBIT_GATE,
                    .symmetric = true},
    NativeOperation{.name = "delay",
                    .arity = 0,
                    .role = OperationRole::DELAY,
                    .requiredArgs = DELAY_ARGS,
                    .symmetric = true,
                    .noCalibrationNeeded = true},
    NativeOperation{.name = "measure",
                    .arity = 0,
                    .role = OperationRole::MEASUREMENT,
                    .requiredArgs = MEASURE_ARGS,
                    .optionalArgs = MEASURE_OPTIONAL_ARGS,
                    .factorizable = true},
    NativeOperation{.name = "measurement",
                    .arity = 0,
                    .role = OperationRole::MEASUREMENT,
                    .requiredArgs = MEASURE_ARGS,
                    .factorizable = true,
                    .renamedTo = "measure"},
    NativeOperation{
        .name = "move", .arity = 2, .role = OperationRole::MOVE},
    NativeOperation{.name = "phased_rx",
                    .arity = 1,
                    .role = OperationRole::SINGLE_QUBIT_ROTATION,
                    .requiredArgs = PRX_ARGS,
                    .renamedTo = "prx"},
    NativeOperation{.name = "prx",
                    .arity = 1,
                    .role = OperationRole::SINGLE_QUBIT_ROTATION,
                    .requiredArgs = PRX_ARGS},
    NativeOperation{.name = "reset",
                    .arity = 0,
                    .role = OperationRole::RESET,
                    .symmetric = true,
                    .factorizable = true},
    NativeOperation{.name = "reset_wait",
                    .arity = 0,
                    .role = OperationRole::RESET,
                    .symmetric = true,
                    .factorizable = true,
                    .noCalibrationNeeded = true},
};
static_assert(std::ranges::is_sorted(NATIVE_OPERATIONS, {},
                                     &NativeOperation::name));
} // namespace

auto findNativeOperation(const std::string_view name)
    -> const NativeOperation* {
  const auto it = std::ranges::lower_bound(NATIVE_OPERATIONS, name, {},
                                           &NativeOperation::name);
  if (it != NATIVE_OPERATIONS.end() && it->name == name) {
    return &*it;
  }
  return nullptr;
}

auto nativeOperations() -> std::span<const NativeOperation> {
  return NATIVE_OPERATIONS;
}
} // namespace dqa
