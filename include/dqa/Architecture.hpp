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

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace dqa {
/// The loci on which one implementation of a gate is calibrated.
struct GateImplementationInfo {
  /// Allowed loci in the order they are declared by the calibration.
  Loci loci;

  /// Creates an implementation info from a JSON specification.
  [[nodiscard]] static auto fromJSON(const nlohmann::json& json)
      -> GateImplementationInfo;
};

/**
 * @brief Calibrated implementations of one quantum operation.
 * @details Every implementation declares its own loci, independent of the
 * others. The default implementation is used when an instruction does not
 * request a specific one, unless it is overridden for a particular locus.
 */
class GateInfo {
  std::map<std::string, GateImplementationInfo> implementations_;
  std::string defaultImplementation_;
  std::map<Locus, std::string> overrideDefaultImplementation_;
  /// Ordered, de-duplicated union of the loci of all implementations.
  Loci loci_;

public:
  /**
   * @brief Construct the gate info and derive the union of the loci.
   * @throw std::invalid_argument If there are no implementations, or the
   * default implementation or an override names an implementation that does
   * not exist.
   */
  GateInfo(std::map<std::string, GateImplementationInfo> implementations,
           std::string defaultImplementation,
           std::map<Locus, std::string> overrideDefaultImplementation = {});

  /// Creates a gate info from a JSON specification.
  [[nodiscard]] static auto fromJSON(const nlohmann::json& json) -> GateInfo;

  [[nodiscard]] auto getImplementations() const
      -> const std::map<std::string, GateImplementationInfo>& {
    return implementations_;
  }
  [[nodiscard]] auto getDefaultImplementation() const -> const std::string& {
    return defaultImplementation_;
  }
  [[nodiscard]] auto getOverrideDefaultImplementation() const
      -> const std::map<Locus, std::string>& {
    return overrideDefaultImplementation_;
  }
  /// @return the implementation info with the given name or nullptr.
  [[nodiscard]] auto findImplementation(const std::string& name) const
      -> const GateImplementationInfo*;
  /**
   * @return all loci of all implementations, each listed once, in the order
   * of the implementations and their declared loci.
   */
  [[nodiscard]] auto loci() const -> const Loci& { return loci_; }
  /**
   * @return the implementation used for @p locus if the instruction does not
   * name one, i.e., the locus-specific override if present and the default
   * implementation otherwise.
   */
  [[nodiscard]] auto defaultImplementationFor(const Locus& locus) const
      -> const std::string&;
};

/**
 * @brief Dynamic quantum architecture (DQA) of a QPU.
 * @details Describes the operations, implementations and loci that are
 * available for a specific calibration set. The object is immutable once
 * constructed and can be shared read-only between concurrent validations.
 */
class Architecture {
  std::string calibrationSetId_;
  std::vector<Component> qubits_;
  std::vector<Component> computationalResonators_;
  std::map<std::string, GateInfo> gates_;
  Components qubitSet_;
  Components resonatorSet_;
  /// Sorted union of qubits and computational resonators.
  Components components_;

public:
  /**
   * @brief Construct an architecture and check its invariants.
   * @throw std::invalid_argument If qubits and resonators are not disjoint, a
   * component is listed twice, or a locus of some gate names an unknown
   * component.
   */
  Architecture(std::string calibrationSetId, std::vector<Component> qubits,
               std::vector<Component> computationalResonators,
               std::map<std::string, GateInfo> gates);

  /// Creates an architecture from a JSON specification.
  [[nodiscard]] static auto fromJSON(const nlohmann::json& json)
      -> Architecture;
  /// Parses the string as JSON and creates an architecture from it.
  [[nodiscard]] static auto fromJSONString(std::string_view json)
      -> Architecture;
  /**
   * Reads the file and creates an architecture from it.
   * @throw std::runtime_error If the file cannot be opened or parsed.
   */
  [[nodiscard]] static auto fromJSONFile(const std::string& filename)
      -> Architecture;

  [[nodiscard]] auto getCalibrationSetId() const -> const std::string& {
    return calibrationSetId_;
  }
  [[nodiscard]] auto getQubits() const -> const std::vector<Component>& {
    return qubits_;
  }
  [[nodiscard]] auto getComputationalResonators() const
      -> const std::vector<Component>& {
    return computationalResonators_;
  }
  [[nodiscard]] auto getGates() const
      -> const std::map<std::string, GateInfo>& {
    return gates_;
  }
  [[nodiscard]] auto components() const -> const Components& {
    return components_;
  }
  [[nodiscard]] auto isQubit(const Component& c) const -> bool {
    return qubitSet_.contains(c);
  }
  [[nodiscard]] auto isComputationalResonator(const Component& c) const
      -> bool {
    return resonatorSet_.contains(c);
  }
  [[nodiscard]] auto hasComponent(const Component& c) const -> bool {
    return components_.contains(c);
  }
  /// @return the gate info of the operation or nullptr if it is unsupported.
  [[nodiscard]] auto findGate(const std::string& name) const -> const GateInfo*;
};
} // namespace dqa
