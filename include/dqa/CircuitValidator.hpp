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
#include "dqa/InstructionValidator.hpp"
#include "dqa/MoveValidator.hpp"

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace dqa {
/**
 * @brief Validates circuit batches against a dynamic quantum architecture
 * before they are submitted for execution.
 *
 * @details The validator combines the static instruction checks, the qubit
 * mapping validation, the per-instruction locus validation, the measurement
 * key check, and the MOVE sandwich validation. The first violation aborts
 * the validation and is reported as a CircuitValidationError. The validator
 * does not modify the architecture and keeps no state between calls, i.e.,
 * one instance can be used by several threads concurrently.
 */
class CircuitValidator {
public:
  /// Collection of the configuration parameters of the validator.
  struct Config {
    /// Configuration of the MOVE sandwich validation
    MoveValidator::Config moveValidatorConfig{};
    /// Log level for the validator
    spdlog::level::level_enum logLevel = spdlog::level::info;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Config, moveValidatorConfig,
                                                logLevel);
  };

private:
  std::reference_wrapper<const Architecture> architecture_;
  Config config_;
  InstructionValidator instructionValidator_;
  MoveValidator moveValidator_;

public:
  /**
   * Construct a validator for the given architecture and configuration.
   *
   * @param architecture is the architecture to validate against; it must
   * outlive the validator.
   * @param config is the configuration of the validator.
   */
  CircuitValidator(const Architecture& architecture, const Config& config);

  /**
   * Construct a validator for the given architecture with the default
   * configuration, i.e., strict MOVE validation and closed sandwiches.
   */
  explicit CircuitValidator(const Architecture& architecture)
      : CircuitValidator(architecture, {}) {}

  // the validator only references the architecture
  CircuitValidator(Architecture&& architecture, const Config& config) = delete;
  explicit CircuitValidator(Architecture&& architecture) = delete;

  /**
   * Validate a batch of circuits.
   *
   * @param circuits are the circuits to validate.
   * @param mapping maps the logical qubit names used in the circuits to
   * physical names of the architecture. If it is not given, the circuits must
   * use physical names already. The mapping is used for all circuits.
   * @throw CircuitValidationError for the first violation found, carrying
   * the index of the circuit it occurred in where applicable.
   */
  auto validate(const CircuitBatch& circuits,
                const std::optional<QubitMapping>& mapping = std::nullopt) const
      -> void;

  /**
   * Validate one circuit against the architecture, assuming the mapping has
   * been validated for it already.
   *
   * @param index is the index of the circuit within its batch and is attached
   * to a reported violation.
   * @param circuit is the circuit to validate.
   * @param mapping is the optional logical to physical qubit mapping.
   */
  auto validateCircuit(std::size_t index, const Circuit& circuit,
                       const std::optional<QubitMapping>& mapping) const
      -> void;

  [[nodiscard]] auto getConfig() const -> const Config& { return config_; }
};
} // namespace dqa
