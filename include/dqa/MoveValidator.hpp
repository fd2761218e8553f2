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

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dqa {
/**
 * This class checks that the MOVE instructions of a circuit form proper
 * sandwiches.
 *
 * @details A MOVE instruction with locus (qubit, resonator) transfers the
 * state of the qubit into an empty resonator and opens a sandwich. The next
 * MOVE on the same resonator must act on the same qubit and transfers the
 * state back, which closes the sandwich. While the state of a qubit resides in
 * a resonator, only the operations in the allow-list may act on that qubit.
 */
class MoveValidator {
  /// A reference to the architecture to check against
  std::reference_wrapper<const Architecture> architecture_;

public:
  /// The configuration of the MoveValidator
  struct Config {
    /// How strictly MOVE sandwiches are validated.
    enum class Mode : uint8_t {
      /// Do not validate MOVE instructions at all.
      NONE,
      /**
       * Only barriers may act on a qubit whose state is in a resonator.
       */
      STRICT,
      /**
       * Additionally to barriers, single-qubit rotations may act on a qubit
       * whose state is in a resonator.
       */
      ALLOW_PRX
    };
    Mode mode = Mode::STRICT;
    /// All sandwiches must be closed when the circuit ends.
    bool mustCloseSandwiches = true;
    /**
     * Names of further operations that may act on a qubit whose state is in a
     * resonator, e.g., single-qubit rotations of an architecture that names
     * them differently.
     */
    std::vector<std::string> additionalSandwichOperations;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Config, mode,
                                                mustCloseSandwiches,
                                                additionalSandwichOperations);
  };

private:
  /// The configuration of the MoveValidator
  Config config_;
  /// Operations that may act on qubits whose state is in a resonator
  std::set<std::string> allowedInSandwich_;

public:
  /// Create a MoveValidator for the architecture with the given configuration
  MoveValidator(const Architecture& architecture, const Config& config);
  MoveValidator(Architecture&& architecture, const Config& config) = delete;

  /**
   * Processes the instructions of the circuit in order and tracks which
   * resonator holds the state of which qubit.
   * @param circuit is the circuit to check
   * @param mapping is the optional logical to physical qubit mapping
   * @throw CircuitValidationError If a MOVE is not supported, acts on an
   * invalid locus, would split or mismatch a qubit state, if another
   * instruction acts on a moved qubit, or if a sandwich is left open although
   * sandwiches must be closed.
   */
  auto validate(const Circuit& circuit,
                const std::optional<QubitMapping>& mapping) const -> void;

  /// @return whether the operation may act on qubits in a resonator.
  [[nodiscard]] auto isAllowedInSandwich(const std::string& name) const
      -> bool {
    return allowedInSandwich_.contains(name);
  }
  [[nodiscard]] auto getConfig() const -> const Config& { return config_; }
};

// unknown values fall back to the first entry
NLOHMANN_JSON_SERIALIZE_ENUM(MoveValidator::Config::Mode,
                             {
                                 {MoveValidator::Config::Mode::STRICT,
                                  "strict"},
                                 {MoveValidator::Config::Mode::NONE, "none"},
                                 {MoveValidator::Config::Mode::ALLOW_PRX,
                                  "allow_prx"},
                             })
} // namespace dqa
