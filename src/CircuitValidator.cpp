/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/CircuitValidator.hpp"

#include "dqa/Architecture.hpp"
#include "dqa/Circuit.hpp"
#include "dqa/CircuitValidationError.hpp"
#include "dqa/Definitions.hpp"
#include "dqa/InstructionValidator.hpp"
#include "dqa/MoveValidator.hpp"
#include "dqa/QubitMapping.hpp"

#include <chrono>
#include <cstddef>
#include <istream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace dqa {
CircuitValidator::CircuitValidator(const Architecture& architecture,
                                   const Config& config)
    : architecture_(architecture), config_(config),
      instructionValidator_(architecture),
      moveValidator_(architecture, config.moveValidatorConfig) {
  spdlog::set_level(config.logLevel);
}

auto CircuitValidator::validate(
    const CircuitBatch& circuits,
    const std::optional<QubitMapping>& mapping) const -> void {
  SPDLOG_DEBUG("Validating {} circuit(s) against calibration set {}",
               circuits.size(), architecture_.get().getCalibrationSetId());
#if SPDLOG_ACTIVE_LEVEL <= SPDLOG_LEVEL_DEBUG
  if (spdlog::should_log(spdlog::level::debug)) {
    SPDLOG_DEBUG("Used validator settings:");
    const nlohmann::json configJson = config_;
    std::istringstream iss(configJson.dump(2));
    std::string line;
    while (std::getline(iss, line)) {
      SPDLOG_DEBUG(line);
    }
  }
#endif // SPDLOG_ACTIVE_LEVEL <= SPDLOG_LEVEL_DEBUG
  const auto start = std::chrono::system_clock::now();

  // architecture-independent checks first
  for (std::size_t i = 0; i < circuits.size(); ++i) {
    for (const auto& instruction : circuits[i].instructions) {
      try {
        InstructionValidator::validateStatic(instruction);
      } catch (const CircuitValidationError& e) {
        SPDLOG_DEBUG("Circuit {} failed the static validation: {}", i,
                     e.getDetail());
        throw e.atCircuit(i);
      }
    }
  }

  validateQubitMapping(architecture_, circuits, mapping);

  for (std::size_t i = 0; i < circuits.size(); ++i) {
    validateCircuit(i, circuits[i], mapping);
  }

  const auto end = std::chrono::system_clock::now();
  SPDLOG_INFO(
      "Validated {} circuit(s) in {}us", circuits.size(),
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count());
}

auto CircuitValidator::validateCircuit(
    const std::size_t index, const Circuit& circuit,
    const std::optional<QubitMapping>& mapping) const -> void {
  SPDLOG_DEBUG("Validating circuit {} ('{}') with {} instruction(s)", index,
               circuit.name, circuit.instructions.size());
  try {
    MeasurementKeyChecker measurementKeys;
    for (const auto& instruction : circuit.instructions) {
      instructionValidator_.validate(instruction, mapping);
      measurementKeys.check(instruction);
    }
    moveValidator_.validate(circuit, mapping);
  } catch (const CircuitValidationError& e) {
    SPDLOG_DEBUG("Circuit {} failed the validation ({}): {}", index,
                 toString(e.getReason()), e.getDetail());
    throw e.atCircuit(index);
  }
}
} // namespace dqa
