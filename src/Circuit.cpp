/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/Circuit.hpp"

#include "dqa/Definitions.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dqa {
auto Instruction::fromJSON(const nlohmann::json& json) -> Instruction {
  if (!json.is_object()) {
    throw std::invalid_argument("Instruction must be a JSON object");
  }
  Instruction instruction;
  if (json.contains("name") && json["name"].is_string()) {
    instruction.name = json["name"];
  } else {
    throw std::invalid_argument("Instruction name must be a string");
  }
  if (json.contains("qubits") && json["qubits"].is_array()) {
    for (const auto& qubit : json["qubits"]) {
      if (!qubit.is_string()) {
        throw std::invalid_argument("Qubits of instruction '" +
                                    instruction.name + "' must be strings");
      }
      instruction.qubits.emplace_back(qubit.get<std::string>());
    }
  } else {
    throw std::invalid_argument("Qubits of instruction '" + instruction.name +
                                "' must be an array");
  }
  if (json.contains("args") && !json["args"].is_null()) {
    if (!json["args"].is_object()) {
      throw std::invalid_argument("Arguments of instruction '" +
                                  instruction.name + "' must be an object");
    }
    instruction.args = json["args"];
  }
  if (json.contains("implementation") && !json["implementation"].is_null()) {
    if (!json["implementation"].is_string()) {
      throw std::invalid_argument("Implementation of instruction '" +
                                  instruction.name + "' must be a string");
    }
    instruction.implementation = json["implementation"].get<std::string>();
  }
  return instruction;
}

auto Instruction::toJSON() const -> nlohmann::json {
  nlohmann::json json{{"name", name}, {"qubits", qubits}, {"args", args}};
  if (implementation.has_value()) {
    json["implementation"] = *implementation;
  }
  return json;
}

auto Instruction::toString() const -> std::string {
  std::ostringstream ss;
  ss << name;
  if (implementation.has_value()) {
    ss << "." << *implementation;
  }
  ss << "(" << locusToString(qubits) << ")";
  if (!args.empty()) {
    ss << " " << args.dump();
  }
  return ss.str();
}

auto operator<<(std::ostream& os, const Instruction& instruction)
    -> std::ostream& {
  return os << instruction.toString();
}

auto Circuit::fromJSON(const nlohmann::json& json) -> Circuit {
  if (!json.is_object()) {
    throw std::invalid_argument("Circuit must be a JSON object");
  }
  Circuit circuit;
  if (json.contains("name") && json["name"].is_string()) {
    circuit.name = json["name"];
  } else {
    throw std::invalid_argument("Circuit name must be a string");
  }
  if (json.contains("instructions") && json["instructions"].is_array()) {
    circuit.instructions.reserve(json["instructions"].size());
    for (const auto& instruction : json["instructions"]) {
      circuit.instructions.emplace_back(Instruction::fromJSON(instruction));
    }
  } else {
    throw std::invalid_argument("Instructions of circuit '" + circuit.name +
                                "' must be an array");
  }
  if (json.contains("metadata")) {
    circuit.metadata = json["metadata"];
  }
  return circuit;
}

auto Circuit::toJSON() const -> nlohmann::json {
  nlohmann::json json{{"name", name},
                      {"instructions", nlohmann::json::array()}};
  for (const auto& instruction : instructions) {
    json["instructions"].emplace_back(instruction.toJSON());
  }
  if (!metadata.is_null()) {
    json["metadata"] = metadata;
  }
  return json;
}

auto Circuit::allQubits() const -> std::set<std::string> {
  std::set<std::string> qubits;
  for (const auto& instruction : instructions) {
    qubits.insert(instruction.qubits.cbegin(), instruction.qubits.cend());
  }
  return qubits;
}

auto circuitBatchFromJSON(const nlohmann::json& json) -> CircuitBatch {
  if (!json.is_array()) {
    throw std::invalid_argument("Circuit batch must be a JSON array");
  }
  CircuitBatch circuits;
  circuits.reserve(json.size());
  for (std::size_t i = 0; i < json.size(); ++i) {
    try {
      circuits.emplace_back(Circuit::fromJSON(json[i]));
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument("Circuit at index " + std::to_string(i) +
                                  ": " + e.what());
    }
  }
  return circuits;
}

auto qubitMappingFromJSON(const nlohmann::json& json) -> QubitMapping {
  QubitMapping mapping;
  auto insert = [&mapping](const nlohmann::json& logical,
                           const nlohmann::json& physical) {
    if (!logical.is_string() || !physical.is_string()) {
      throw std::invalid_argument("Qubit names in mapping must be strings");
    }
    if (!mapping
             .emplace(logical.get<std::string>(), physical.get<std::string>())
             .second) {
      throw std::invalid_argument("Logical qubit " +
                                  logical.get<std::string>() +
                                  " is mapped more than once");
    }
  };
  if (json.is_object()) {
    for (const auto& [logical, physical] : json.items()) {
      insert(logical, physical);
    }
  } else if (json.is_array()) {
    // JSON Example:
    // [{"logical_name": "q0", "physical_name": "QB1"}]
    for (const auto& entry : json) {
      if (!entry.is_object() || !entry.contains("logical_name") ||
          !entry.contains("physical_name")) {
        throw std::invalid_argument("Qubit mapping entries must contain "
                                    "logical_name and physical_name");
      }
      insert(entry["logical_name"], entry["physical_name"]);
    }
  } else {
    throw std::invalid_argument("Qubit mapping must be an object or an array");
  }
  return mapping;
}

auto qubitMappingToJSON(const QubitMapping& mapping) -> nlohmann::json {
  auto json = nlohmann::json::array();
  for (const auto& [logical, physical] : mapping) {
    json.push_back({{"logical_name", logical}, {"physical_name", physical}});
  }
  return json;
}
} // namespace dqa
