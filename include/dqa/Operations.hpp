/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace dqa {
/// The JSON type an instruction argument must have.
enum class ArgumentType : uint8_t { NUMBER, STRING };

/// Name and type of one argument of a native operation.
struct ArgumentSpec {
  std::string_view name;
  ArgumentType type = ArgumentType::NUMBER;
};

/**
 * @brief Semantic role of a native operation.
 * @details Used to derive which operations may act on a qubit whose state is
 * parked in a resonator, independent of the concrete operation names.
 */
enum class OperationRole : uint8_t {
  BARRIER,
  DELAY,
  MEASUREMENT,
  SINGLE_QUBIT_ROTATION,
  CONDITIONAL_ROTATION,
  RESET,
  TWO_QUBIT_GATE,
  MOVE,
};

/**
 * @brief Static, architecture-independent description of a native operation.
 */
struct NativeOperation {
  std::string_view name;
  /// Number of locus components, 0 means any positive number.
  std::size_t arity = 0;
  OperationRole role = OperationRole::BARRIER;
  std::span<const ArgumentSpec> requiredArgs;
  std::span<const ArgumentSpec> optionalArgs;
  /// Any permutation of an allowed locus is allowed as well.
  bool symmetric = false;
  /// Locus components are validated individually instead of as a tuple.
  bool factorizable = false;
  /// The operation is available on every component without calibration.
  bool noCalibrationNeeded = false;
  /// Non-empty for deprecated aliases, names the canonical operation.
  std::string_view renamedTo;

  /// @return the name of the operation in the architecture's gate table.
  [[nodiscard]] constexpr auto canonicalName() const -> std::string_view {
    return renamedTo.empty() ? name : renamedTo;
  }
  [[nodiscard]] constexpr auto isMeasurement() const -> bool {
    return role == OperationRole::MEASUREMENT;
  }
};

/// @return the descriptor of the operation or nullptr if it is unknown.
[[nodiscard]] auto findNativeOperation(std::string_view name)
    -> const NativeOperation*;

/// @return all known native operations including deprecated aliases.
[[nodiscard]] auto nativeOperations() -> std::span<const NativeOperation>;

/// Name of the native MOVE operation.
constexpr std::string_view MOVE_OPERATION = "move";
/// Name of the argument holding the measurement result label.
constexpr std::string_view MEASUREMENT_KEY_ARGUMENT = "key";
} // namespace dqa
