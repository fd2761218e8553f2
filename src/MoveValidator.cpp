/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/MoveValidator.hpp"

#include "dqa/Architecture.hpp"
#include "dqa/Circuit.hpp"
#include "dqa/CircuitValidationError.hpp"
#include "dqa/Definitions.hpp"
#include "dqa/Operations.hpp"
#include "dqa/QubitMapping.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace dqa {
namespace {
using Reason = CircuitValidationError::Reason;

/// Formats the occupation, e.g., "{CR1: QB1, CR2: QB3}".
auto occupationToString(const std::map<Component, Component>& occupation)
    -> std::string {
  std::ostringstream ss;
  ss << "{";
  for (auto it = occupation.cbegin(); it != occupation.cend(); ++it) {
    if (it != occupation.cbegin()) {
      ss << ", ";
    }
    ss << it->first << ": " << it->second;
  }
  ss << "}";
  return ss.str();
}
} // namespace

MoveValidator::MoveValidator(const Architecture& architecture,
                             const Config& config)
    : architecture_(architecture), config_(config) {
  for (const auto& op : nativeOperations()) {
    if (op.role == OperationRole::BARRIER ||
        (config_.mode == Config::Mode::ALLOW_PRX &&
         op.role == OperationRole::SINGLE_QUBIT_ROTATION)) {
      allowedInSandwich_.emplace(op.name);
    }
  }
  allowedInSandwich_.insert(config_.additionalSandwichOperations.cbegin(),
                            config_.additionalSandwichOperations.cend());
}

auto MoveValidator::validate(const Circuit& circuit,
                             const std::optional<QubitMapping>& mapping) const
    -> void {
  if (config_.mode == Config::Mode::NONE) {
    return;
  }
  const auto& architecture = architecture_.get();
  const std::string moveName(MOVE_OPERATION);
  const auto isMove = [&moveName](const Instruction& instruction) {
    return instruction.name == moveName;
  };
  // check if MOVE gates are allowed on this architecture
  if (architecture.findGate(moveName) == nullptr) {
    if (const auto it = std::ranges::find_if(circuit.instructions, isMove);
        it != circuit.instructions.end()) {
      throw CircuitValidationError(Reason::MOVE_UNSUPPORTED,
                                   "MOVE instruction is not supported by the "
                                   "given device architecture.",
                                   {.instruction = *it,
                                    .operation = moveName,
                                    .locus = it->qubits});
    }
    return;
  }

  // resonator -> qubit whose state it holds, resonators not in the map are
  // empty
  std::map<Component, Component> occupation;
  // qubits whose state is currently in some resonator
  Components moved;

  for (const auto& instruction : circuit.instructions) {
    const auto locus = mapLocus(instruction.qubits, mapping);
    const CircuitValidationError::Context context{
        .instruction = instruction,
        .operation = instruction.name,
        .locus = instruction.qubits,
        .mappedLocus =
            mapping.has_value() ? std::optional(locus) : std::nullopt};

    if (isMove(instruction)) {
      if (locus.size() != 2 || !architecture.isQubit(locus[0]) ||
          !architecture.isComputationalResonator(locus[1])) {
        throw CircuitValidationError(
            Reason::MOVE_INVALID_LOCUS,
            "MOVE instructions are only allowed between qubit and resonator, "
            "not (" +
                locusToString(locus) + ").",
            context);
      }
      const auto& qubit = locus[0];
      const auto& resonator = locus[1];
      if (const auto it = occupation.find(resonator); it == occupation.end()) {
        // opening MOVE: the qubit state must not be in another resonator
        if (moved.contains(qubit)) {
          auto ctx = context;
          ctx.components = {qubit};
          throw CircuitValidationError(
              Reason::MOVE_SPLIT_STATE,
              "MOVE instruction (" + locusToString(locus) + "): state of " +
                  qubit + " is in another resonator: " +
                  occupationToString(occupation) + ".",
              ctx);
        }
        occupation.emplace(resonator, qubit);
        moved.emplace(qubit);
      } else {
        // closing MOVE: the qubit must be the one whose state is in the
        // resonator
        if (it->second != qubit) {
          auto ctx = context;
          ctx.components = {it->second, qubit};
          throw CircuitValidationError(
              Reason::MOVE_MISMATCHED_CLOSE,
              "MOVE instruction (" + locusToString(locus) +
                  ") to an already occupied resonator: " +
                  occupationToString(occupation) + ".",
              ctx);
        }
        occupation.erase(it);
        moved.erase(qubit);
      }
    } else if (!moved.empty() && !isAllowedInSandwich(instruction.name)) {
      Components overlap;
      for (const auto& component : locus) {
        if (moved.contains(component)) {
          overlap.emplace(component);
        }
      }
      if (!overlap.empty()) {
        auto ctx = context;
        ctx.components = overlap;
        throw CircuitValidationError(
            Reason::MOVE_QUBIT_IN_USE,
            "Instruction " + instruction.name + " acts on (" +
                locusToString(locus) + ") while the state(s) of {" +
                locusToString(Locus(overlap.cbegin(), overlap.cend())) +
                "} are in a resonator. Current resonator occupation: " +
                occupationToString(occupation) + ".",
            ctx);
      }
    }
  }

  // all MOVE sandwiches must be closed before the circuit ends
  if (!occupation.empty()) {
    if (config_.mustCloseSandwiches) {
      Components open;
      for (const auto& [resonator, qubit] : occupation) {
        open.emplace(resonator);
        open.emplace(qubit);
      }
      throw CircuitValidationError(
          Reason::MOVE_UNCLOSED_SANDWICH,
          "Circuit ends while qubit state(s) are still in a resonator: " +
              occupationToString(occupation) + ".",
          {.components = open});
    }
    SPDLOG_DEBUG("Circuit '{}' ends with open MOVE sandwiches: {}",
                 circuit.name, occupationToString(occupation));
  }
}
} // namespace dqa
