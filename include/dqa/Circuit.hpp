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

#include "dqa/Definitions.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dqa {
/**
 * @brief One native quantum operation in a circuit.
 * @details The qubits are the locus of the instruction before a qubit mapping
 * is applied. The arguments are kept as a JSON object since their types
 * depend on the operation.
 */
struct Instruction {
  std::string name;
  std::vector<std::string> qubits;
  nlohmann::json args = nlohmann::json::object();
  /// Requested implementation, empty to let the QPU choose.
  std::optional<std::string> implementation = std::nullopt;

  Instruction() = default;
  Instruction(std::string n, std::vector<std::string> q,
              nlohmann::json a = nlohmann::json::object(),
              std::optional<std::string> impl = std::nullopt)
      : name(std::move(n)), qubits(std::move(q)), args(std::move(a)),
        implementation(std::move(impl)) {}

  /// Creates an instruction from its JSON representation.
  [[nodiscard]] static auto fromJSON(const nlohmann::json& json)
      -> Instruction;
  [[nodiscard]] auto toJSON() const -> nlohmann::json;
  /// @return a short human-readable representation, e.g., "cz(QB1, QB2)".
  [[nodiscard]] auto toString() const -> std::string;

  [[nodiscard]] auto operator==(const Instruction& other) const
      -> bool = default;
};

auto operator<<(std::ostream& os, const Instruction& instruction)
    -> std::ostream&;

/// An ordered sequence of instructions executed in the given order.
struct Circuit {
  std::string name;
  std::vector<Instruction> instructions;
  nlohmann::json metadata = nullptr;

  /// Creates a circuit from its JSON representation.
  [[nodiscard]] static auto fromJSON(const nlohmann::json& json) -> Circuit;
  [[nodiscard]] auto toJSON() const -> nlohmann::json;
  /// @return all qubit names referenced by the instructions of the circuit.
  [[nodiscard]] auto allQubits() const -> std::set<std::string>;
};

using CircuitBatch = std::vector<Circuit>;

/// Creates a circuit batch from a JSON array of circuits.
[[nodiscard]] auto circuitBatchFromJSON(const nlohmann::json& json)
    -> CircuitBatch;

/**
 * @brief Creates a qubit mapping from JSON.
 * @details Accepts an object mapping logical to physical names as well as a
 * list of objects with the fields "logical_name" and "physical_name".
 * @throw std::invalid_argument If the JSON has neither form or a logical
 * name appears twice.
 */
[[nodiscard]] auto qubitMappingFromJSON(const nlohmann::json& json)
    -> QubitMapping;
/// Serializes the mapping as a list of logical/physical name pairs.
[[nodiscard]] auto qubitMappingToJSON(const QubitMapping& mapping)
    -> nlohmann::json;
} // namespace dqa
