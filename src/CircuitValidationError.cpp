/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/CircuitValidationError.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dqa {
namespace {
auto formatMessage(const std::string& detail,
                   const CircuitValidationError::Context& context)
    -> std::string {
  if (context.circuitIndex.has_value()) {
    return "Circuit " + std::to_string(*context.circuitIndex) + ": " + detail;
  }
  return detail;
}
} // namespace

CircuitValidationError::CircuitValidationError(const Reason reason,
                                               const std::string& detail,
                                               Context context)
    : std::invalid_argument(formatMessage(detail, context)), reason_(reason),
      detail_(detail), context_(std::move(context)) {}

auto CircuitValidationError::atCircuit(const std::size_t index) const
    -> CircuitValidationError {
  auto context = context_;
  context.circuitIndex = index;
  return {reason_, detail_, std::move(context)};
}

auto CircuitValidationError::toJSON() const -> nlohmann::json {
  nlohmann::json json{{"reason", std::string(toString(reason_))},
                      {"message", what()}};
  if (context_.circuitIndex.has_value()) {
    json["circuit_index"] = *context_.circuitIndex;
  }
  if (context_.instruction.has_value()) {
    json["instruction"] = context_.instruction->toJSON();
  }
  if (!context_.operation.empty()) {
    json["operation"] = context_.operation;
  }
  if (!context_.locus.empty()) {
    json["locus"] = context_.locus;
  }
  if (context_.mappedLocus.has_value()) {
    json["mapped_locus"] = *context_.mappedLocus;
  }
  if (!context_.components.empty()) {
    json["components"] = context_.components;
  }
  return json;
}

auto toString(const CircuitValidationError::Reason reason) -> std::string_view {
  using Reason = CircuitValidationError::Reason;
  switch (reason) {
  case Reason::UNKNOWN_OPERATION:
    return "unknown-operation";
  case Reason::UNSUPPORTED_OPERATION:
    return "unsupported-operation";
  case Reason::UNSUPPORTED_IMPLEMENTATION:
    return "unsupported-implementation";
  case Reason::LOCUS_NOT_ALLOWED:
    return "locus-not-allowed";
  case Reason::INVALID_ARITY:
    return "invalid-arity";
  case Reason::INVALID_ARGUMENTS:
    return "invalid-arguments";
  case Reason::NON_INJECTIVE_MAPPING:
    return "non-injective-mapping";
  case Reason::UNMAPPED_QUBITS:
    return "unmapped-qubits";
  case Reason::UNMAPPED_TARGET_MISSING:
    return "unmapped-target-missing";
  case Reason::DUPLICATE_MEASUREMENT_KEY:
    return "duplicate-measurement-key";
  case Reason::MOVE_INVALID_LOCUS:
    return "move-invalid-locus";
  case Reason::MOVE_SPLIT_STATE:
    return "move-split-state";
  case Reason::MOVE_MISMATCHED_CLOSE:
    return "move-mismatched-close";
  case Reason::MOVE_QUBIT_IN_USE:
    return "move-qubit-in-use";
  case Reason::MOVE_UNSUPPORTED:
    return "move-unsupported";
  case Reason::MOVE_UNCLOSED_SANDWICH:
    return "move-unclosed-sandwich";
  }
  throw std::invalid_argument("Unknown validation failure reason");
}
} // namespace dqa
