/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/InstructionValidator.hpp"

#include "dqa/Architecture.hpp"
#include "dqa/Circuit.hpp"
#include "dqa/CircuitValidationError.hpp"
#include "dqa/Definitions.hpp"
#include "dqa/Operations.hpp"
#include "dqa/QubitMapping.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>
#include <string>

namespace dqa {
namespace {
using Reason = CircuitValidationError::Reason;

auto hasType(const nlohmann::json& value, const ArgumentType type) -> bool {
  switch (type) {
  case ArgumentType::NUMBER:
    return value.is_number();
  case ArgumentType::STRING:
    return value.is_string();
  }
  return false;
}

auto lookupOperation(const Instruction& instruction) -> const NativeOperation& {
  const auto* op = findNativeOperation(instruction.name);
  if (op == nullptr) {
    throw CircuitValidationError(Reason::UNKNOWN_OPERATION,
                                 "Unknown quantum operation '" +
                                     instruction.name + "'.",
                                 {.instruction = instruction,
                                  .operation = instruction.name,
                                  .locus = instruction.qubits});
  }
  return *op;
}
} // namespace

auto InstructionValidator::validateStatic(const Instruction& instruction)
    -> const NativeOperation& {
  const auto& op = lookupOperation(instruction);
  const CircuitValidationError::Context context{
      .instruction = instruction,
      .operation = instruction.name,
      .locus = instruction.qubits};
  if (!op.renamedTo.empty()) {
    SPDLOG_WARN("The quantum operation '{}' is deprecated, use '{}' instead.",
                op.name, op.renamedTo);
  }

  if (instruction.qubits.empty()) {
    throw CircuitValidationError(Reason::INVALID_ARITY,
                                 instruction.toString() +
                                     ": An instruction must act on at least "
                                     "one qubit.",
                                 context);
  }
  if (op.arity > 0 && instruction.qubits.size() != op.arity) {
    throw CircuitValidationError(
        Reason::INVALID_ARITY,
        instruction.toString() + ": The '" + instruction.name +
            "' operation acts on " + std::to_string(op.arity) +
            " qubit(s), but " + std::to_string(instruction.qubits.size()) +
            " were given.",
        context);
  }
  std::set<std::string> seen;
  for (const auto& qubit : instruction.qubits) {
    if (!seen.emplace(qubit).second) {
      throw CircuitValidationError(Reason::INVALID_ARITY,
                                   instruction.toString() + ": Qubit " +
                                       qubit + " appears more than once.",
                                   context);
    }
  }

  const auto& args = instruction.args;
  if (!args.is_null() && !args.is_object()) {
    throw CircuitValidationError(Reason::INVALID_ARGUMENTS,
                                 instruction.toString() +
                                     ": The arguments must be an object.",
                                 context);
  }
  for (const auto& spec : op.requiredArgs) {
    const std::string name(spec.name);
    if (args.is_null() || !args.contains(name)) {
      throw CircuitValidationError(Reason::INVALID_ARGUMENTS,
                                   instruction.toString() +
                                       ": Missing argument '" + name + "'.",
                                   context);
    }
    if (!hasType(args[name], spec.type)) {
      throw CircuitValidationError(Reason::INVALID_ARGUMENTS,
                                   instruction.toString() + ": Argument '" +
                                       name + "' has the wrong type.",
                                   context);
    }
  }
  if (args.is_null()) {
    return op;
  }
  for (const auto& item : args.items()) {
    const auto& name = item.key();
    const auto matches = [&name](const ArgumentSpec& spec) {
      return spec.name == name;
    };
    if (std::ranges::any_of(op.requiredArgs, matches)) {
      continue;
    }
    const auto optional = std::ranges::find_if(op.optionalArgs, matches);
    if (optional == op.optionalArgs.end()) {
      throw CircuitValidationError(Reason::INVALID_ARGUMENTS,
                                   instruction.toString() +
                                       ": Unknown argument '" + name + "'.",
                                   context);
    }
    if (!hasType(item.value(), optional->type)) {
      throw CircuitValidationError(Reason::INVALID_ARGUMENTS,
                                   instruction.toString() + ": Argument '" +
                                       name + "' has the wrong type.",
                                   context);
    }
  }
  return op;
}

auto InstructionValidator::checkLocusComponents(
    const Instruction& instruction, const Locus& mappedLocus, const bool mapped,
    const std::function<bool(const Component&)>& allowed,
    const std::string& operation, const std::string& reason) -> void {
  for (std::size_t i = 0; i < mappedLocus.size(); ++i) {
    if (allowed(mappedLocus[i])) {
      continue;
    }
    const auto& qubit = instruction.qubits[i];
    throw CircuitValidationError(
        Reason::LOCUS_NOT_ALLOWED,
        instruction.toString() + ": Component " + qubit +
            (mapped ? " = " + mappedLocus[i] : "") + " " + reason + ".",
        {.instruction = instruction,
         .operation = operation,
         .locus = instruction.qubits,
         .mappedLocus = mapped ? std::optional(mappedLocus) : std::nullopt,
         .components = {mappedLocus[i]}});
  }
}

auto InstructionValidator::validate(
    const Instruction& instruction,
    const std::optional<QubitMapping>& mapping) const -> void {
  const auto& op = lookupOperation(instruction);
  const auto& architecture = architecture_.get();
  const auto mappedLocus = mapLocus(instruction.qubits, mapping);
  const auto mapped = mapping.has_value();

  if (op.noCalibrationNeeded) {
    // all loci of the QPU are allowed
    checkLocusComponents(
        instruction, mappedLocus, mapped,
        [&architecture](const Component& c) {
          return architecture.hasComponent(c);
        },
        instruction.name, "does not exist on the QPU");
    return;
  }

  const std::string gateName(op.canonicalName());
  const auto* gate = architecture.findGate(gateName);
  if (gate == nullptr) {
    throw CircuitValidationError(
        Reason::UNSUPPORTED_OPERATION,
        "Operation '" + gateName +
            "' is not supported by the dynamic quantum architecture.",
        {.instruction = instruction,
         .operation = gateName,
         .locus = instruction.qubits,
         .mappedLocus = mapped ? std::optional(mappedLocus) : std::nullopt});
  }

  const Loci* allowedLoci = nullptr;
  std::string operation = gateName;
  if (instruction.implementation.has_value()) {
    // specific implementation requested
    operation += "." + *instruction.implementation;
    const auto* impl = gate->findImplementation(*instruction.implementation);
    if (impl == nullptr) {
      throw CircuitValidationError(
          Reason::UNSUPPORTED_IMPLEMENTATION,
          "Operation '" + gateName + "' implementation '" +
              *instruction.implementation +
              "' is not supported by the dynamic quantum architecture.",
          {.instruction = instruction,
           .operation = operation,
           .locus = instruction.qubits,
           .mappedLocus = mapped ? std::optional(mappedLocus) : std::nullopt});
    }
    allowedLoci = &impl->loci;
  } else {
    // any implementation is fine
    allowedLoci = &gate->loci();
  }

  if (op.factorizable) {
    Components allowedComponents;
    for (const auto& locus : *allowedLoci) {
      allowedComponents.insert(locus.cbegin(), locus.cend());
    }
    checkLocusComponents(
        instruction, mappedLocus, mapped,
        [&allowedComponents](const Component& c) {
          return allowedComponents.contains(c);
        },
        operation, "is not allowed as locus for '" + operation + "'");
    return;
  }

  const auto matches = [&mappedLocus, &op](const Locus& locus) {
    if (!op.symmetric) {
      return locus == mappedLocus;
    }
    return locus.size() == mappedLocus.size() &&
           std::ranges::is_permutation(locus, mappedLocus);
  };
  if (std::ranges::none_of(*allowedLoci, matches)) {
    throw CircuitValidationError(
        Reason::LOCUS_NOT_ALLOWED,
        "(" + locusToString(instruction.qubits) + ")" +
            (mapped ? " = (" + locusToString(mappedLocus) + ")" : "") +
            " is not allowed as locus for '" + operation + "'.",
        {.instruction = instruction,
         .operation = operation,
         .locus = instruction.qubits,
         .mappedLocus = mapped ? std::optional(mappedLocus) : std::nullopt});
  }
  if (!instruction.implementation.has_value()) {
    SPDLOG_DEBUG("{} runs with implementation '{}'", instruction.toString(),
                 gate->defaultImplementationFor(mappedLocus));
  }
}

auto MeasurementKeyChecker::check(const Instruction& instruction) -> void {
  const auto* op = findNativeOperation(instruction.name);
  if (op == nullptr || !op->isMeasurement()) {
    return;
  }
  const std::string keyName(MEASUREMENT_KEY_ARGUMENT);
  if (!instruction.args.is_object() || !instruction.args.contains(keyName) ||
      !instruction.args[keyName].is_string()) {
    throw CircuitValidationError(
        Reason::INVALID_ARGUMENTS,
        instruction.toString() + ": A measurement needs a string argument '" +
            keyName + "'.",
        {.instruction = instruction,
         .operation = instruction.name,
         .locus = instruction.qubits});
  }
  const auto key = instruction.args[keyName].get<std::string>();
  if (!keys_.emplace(key).second) {
    throw CircuitValidationError(
        Reason::DUPLICATE_MEASUREMENT_KEY,
        instruction.toString() + " has a non-unique measurement key '" + key +
            "'.",
        {.instruction = instruction,
         .operation = instruction.name,
         .locus = instruction.qubits});
  }
}
} // namespace dqa
