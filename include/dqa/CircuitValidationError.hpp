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

#include "dqa/Circuit.hpp"
#include "dqa/Definitions.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dqa {
/**
 * @brief Error raised when a circuit batch is not executable on the given
 * architecture.
 * @details Besides the human-readable message returned by what(), the error
 * carries the reason and the context of the failure as structured fields so
 * that callers can react to the reason instead of parsing the message.
 */
class CircuitValidationError : public std::invalid_argument {
public:
  /// Why the validation failed.
  enum class Reason : uint8_t {
    UNKNOWN_OPERATION,
    UNSUPPORTED_OPERATION,
    UNSUPPORTED_IMPLEMENTATION,
    LOCUS_NOT_ALLOWED,
    INVALID_ARITY,
    INVALID_ARGUMENTS,
    NON_INJECTIVE_MAPPING,
    UNMAPPED_QUBITS,
    UNMAPPED_TARGET_MISSING,
    DUPLICATE_MEASUREMENT_KEY,
    MOVE_INVALID_LOCUS,
    MOVE_SPLIT_STATE,
    MOVE_MISMATCHED_CLOSE,
    MOVE_QUBIT_IN_USE,
    MOVE_UNSUPPORTED,
    MOVE_UNCLOSED_SANDWICH,
  };

  /// Context of a failure, every field is optional.
  struct Context {
    std::optional<std::size_t> circuitIndex;
    std::optional<Instruction> instruction;
    /// Resolved operation, "name" or "name.implementation".
    std::string operation;
    /// Locus as written in the instruction.
    Locus locus;
    /// Locus after applying the qubit mapping, if a mapping was given.
    std::optional<Locus> mappedLocus;
    /// Components or qubits the failure is about.
    Components components;
  };

  CircuitValidationError(Reason reason, const std::string& detail,
                         Context context = {});

  [[nodiscard]] auto getReason() const -> Reason { return reason_; }
  /// @return the message without the circuit index prefix.
  [[nodiscard]] auto getDetail() const -> const std::string& { return detail_; }
  [[nodiscard]] auto getContext() const -> const Context& { return context_; }
  [[nodiscard]] auto getCircuitIndex() const -> std::optional<std::size_t> {
    return context_.circuitIndex;
  }
  /// @return a copy of this error attributed to the circuit at @p index.
  [[nodiscard]] auto atCircuit(std::size_t index) const
      -> CircuitValidationError;
  /// @return the structured representation of the error.
  [[nodiscard]] auto toJSON() const -> nlohmann::json;

private:
  Reason reason_;
  std::string detail_;
  Context context_;
};

/// @return the reason code, e.g., "locus-not-allowed".
[[nodiscard]] auto toString(CircuitValidationError::Reason reason)
    -> std::string_view;
} // namespace dqa
