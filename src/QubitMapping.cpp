/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/QubitMapping.hpp"

#include "dqa/Architecture.hpp"
#include "dqa/Circuit.hpp"
#include "dqa/CircuitValidationError.hpp"
#include "dqa/Definitions.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <ranges>
#include <set>
#include <spdlog/spdlog.h>
#include <string>

namespace dqa {
auto mapLocus(const Locus& locus, const std::optional<QubitMapping>& mapping)
    -> Locus {
  if (!mapping.has_value()) {
    return locus;
  }
  Locus mapped;
  mapped.reserve(locus.size());
  for (const auto& qubit : locus) {
    const auto it = mapping->find(qubit);
    if (it == mapping->end()) {
      throw CircuitValidationError(
          CircuitValidationError::Reason::UNMAPPED_QUBITS,
          "The qubit " + qubit + " is not found in the provided qubit mapping.",
          {.locus = locus, .components = {qubit}});
    }
    mapped.emplace_back(it->second);
  }
  return mapped;
}

auto validateQubitMapping(const Architecture& architecture,
                          const CircuitBatch& circuits,
                          const std::optional<QubitMapping>& mapping) -> void {
  if (!mapping.has_value()) {
    return;
  }
  SPDLOG_DEBUG("Validating qubit mapping with {} entries", mapping->size());

  std::map<Component, std::string> targets;
  for (const auto& [logical, physical] : *mapping) {
    if (const auto [it, inserted] = targets.emplace(physical, logical);
        !inserted) {
      throw CircuitValidationError(
          CircuitValidationError::Reason::NON_INJECTIVE_MAPPING,
          "Multiple logical qubits (" + it->second + ", " + logical +
              ") map to the same physical qubit " + physical + ".",
          {.components = {physical}});
    }
  }

  for (std::size_t i = 0; i < circuits.size(); ++i) {
    Components unmapped;
    for (const auto& qubit : circuits[i].allQubits()) {
      if (!mapping->contains(qubit)) {
        unmapped.emplace(qubit);
      }
    }
    if (!unmapped.empty()) {
      const Locus qubits(unmapped.cbegin(), unmapped.cend());
      throw CircuitValidationError(
          CircuitValidationError::Reason::UNMAPPED_QUBITS,
          "The qubits {" + locusToString(qubits) + "} in circuit '" +
              circuits[i].name +
              "' are not found in the provided qubit mapping.",
          {.circuitIndex = i, .components = unmapped});
    }
  }

  for (const auto& physical : *mapping | std::views::values) {
    if (!architecture.hasComponent(physical)) {
      throw CircuitValidationError(
          CircuitValidationError::Reason::UNMAPPED_TARGET_MISSING,
          "Component " + physical +
              " not present in dynamic quantum architecture.",
          {.components = {physical}});
    }
  }
}
} // namespace dqa
