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

#include "dqa/Architecture.hpp"
#include "dqa/Circuit.hpp"
#include "dqa/Definitions.hpp"
#include "dqa/Operations.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>

namespace dqa {
/**
 * This class checks single instructions against a dynamic quantum
 * architecture, i.e., that the requested operation and implementation are
 * calibrated and that the instruction acts on an allowed locus.
 */
class InstructionValidator {
  /// A reference to the architecture to check against
  std::reference_wrapper<const Architecture> architecture_;

public:
  explicit InstructionValidator(const Architecture& architecture)
      : architecture_(architecture) {}
  explicit InstructionValidator(Architecture&& architecture) = delete;

  /**
   * Checks the architecture-independent properties of an instruction: the
   * operation must be known, the number of qubits must match its arity, the
   * qubits must be distinct, and the arguments must match the required and
   * optional arguments of the operation.
   * @param instruction is the instruction to check
   * @return the descriptor of the operation
   * @throw CircuitValidationError If one of the checks fails.
   */
  static auto validateStatic(const Instruction& instruction)
      -> const NativeOperation&;

  /**
   * Checks that the instruction is executable on the architecture.
   * @details The locus is first translated with the mapping. Operations that
   * need no calibration may act on any component. For all others, the locus
   * is checked against the loci of the requested implementation or, if none
   * is requested, against the loci of all implementations. Factorizable
   * operations are checked component-wise, symmetric operations accept any
   * permutation of an allowed locus, and all others require an exact match.
   * @param instruction is the instruction to check
   * @param mapping is the optional logical to physical qubit mapping
   * @throw CircuitValidationError If the instruction is not executable.
   */
  auto validate(const Instruction& instruction,
                const std::optional<QubitMapping>& mapping) const -> void;

private:
  /// Throws if any mapped component is not contained in @p allowed.
  static auto checkLocusComponents(const Instruction& instruction,
                                   const Locus& mappedLocus, bool mapped,
                                   const std::function<bool(const Component&)>&
                                       allowed,
                                   const std::string& operation,
                                   const std::string& reason) -> void;
};

/**
 * This class checks that the measurement result labels of one circuit are
 * unique. A new checker must be used for every circuit since labels may be
 * reused across circuits.
 */
class MeasurementKeyChecker {
  std::set<std::string> keys_;

public:
  /**
   * Records the label of the instruction if it is a measurement.
   * @throw CircuitValidationError If the label was already used.
   */
  auto check(const Instruction& instruction) -> void;
};
} // namespace dqa
