/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/Architecture.hpp"

#include "dqa/Definitions.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dqa {
namespace {
/// Reads a JSON array of strings, e.g., a locus or a list of qubits.
auto componentsFromJSON(const nlohmann::json& json, const std::string& what)
    -> std::vector<Component> {
  if (!json.is_array()) {
    throw std::invalid_argument(what + " must be an array of strings in "
                                       "architecture spec");
  }
  std::vector<Component> components;
  components.reserve(json.size());
  for (const auto& entry : json) {
    if (!entry.is_string()) {
      throw std::invalid_argument(what + " must be an array of strings in "
                                         "architecture spec");
    }
    components.emplace_back(entry.get<std::string>());
  }
  return components;
}
} // namespace

auto GateImplementationInfo::fromJSON(const nlohmann::json& json)
    -> GateImplementationInfo {
  GateImplementationInfo info;
  // JSON Example:
  // {"loci": [["QB1", "QB2"], ["QB2", "QB3"]]}
  if (json.contains("loci")) {
    if (json["loci"].is_array()) {
      info.loci.reserve(json["loci"].size());
      for (const auto& locus : json["loci"]) {
        auto components = componentsFromJSON(locus, "Locus");
        if (components.empty()) {
          throw std::invalid_argument(
              "Locus must not be empty in architecture spec");
        }
        info.loci.emplace_back(std::move(components));
      }
    } else {
      throw std::invalid_argument(
          "Implementation loci must be an array in architecture spec");
    }
  } else {
    throw std::invalid_argument(
        "Implementation loci are missed in architecture spec");
  }
  return info;
}

GateInfo::GateInfo(
    std::map<std::string, GateImplementationInfo> implementations,
    std::string defaultImplementation,
    std::map<Locus, std::string> overrideDefaultImplementation)
    : implementations_(std::move(implementations)),
      defaultImplementation_(std::move(defaultImplementation)),
      overrideDefaultImplementation_(std::move(overrideDefaultImplementation)) {
  if (implementations_.empty()) {
    throw std::invalid_argument("A gate needs at least one implementation");
  }
  if (!implementations_.contains(defaultImplementation_)) {
    throw std::invalid_argument("Default implementation '" +
                                defaultImplementation_ +
                                "' is not among the implementations");
  }
  for (const auto& [locus, implementation] : overrideDefaultImplementation_) {
    if (!implementations_.contains(implementation)) {
      throw std::invalid_argument("Default implementation override for (" +
                                  locusToString(locus) + ") names unknown "
                                                         "implementation '" +
                                  implementation + "'");
    }
  }
  std::set<Locus> seen;
  for (const auto& [name, info] : implementations_) {
    for (const auto& locus : info.loci) {
      if (seen.emplace(locus).second) {
        loci_.emplace_back(locus);
      }
    }
  }
}

auto GateInfo::fromJSON(const nlohmann::json& json) -> GateInfo {
  if (!json.is_object()) {
    throw std::invalid_argument("Gate info must be an object in architecture "
                                "spec");
  }
  std::map<std::string, GateImplementationInfo> implementations;
  if (json.contains("implementations")) {
    if (json["implementations"].is_object() &&
        !json["implementations"].empty()) {
      for (const auto& [name, implSpec] : json["implementations"].items()) {
        implementations.emplace(name,
                                GateImplementationInfo::fromJSON(implSpec));
      }
    } else {
      throw std::invalid_argument("Gate implementations must be a non-empty "
                                  "object in architecture spec");
    }
  } else {
    throw std::invalid_argument(
        "Gate implementations are missed in architecture spec");
  }
  std::string defaultImplementation;
  if (json.contains("default_implementation")) {
    if (json["default_implementation"].is_string()) {
      defaultImplementation = json["default_implementation"];
    } else {
      throw std::invalid_argument(
          "Default implementation must be a string in architecture spec");
    }
  } else {
    throw std::invalid_argument(
        "Default implementation is missed in architecture spec");
  }
  // JSON Example:
  // "override_default_implementation": {"QB1,QB2": "crf"}
  std::map<Locus, std::string> overrides;
  if (json.contains("override_default_implementation")) {
    if (json["override_default_implementation"].is_object()) {
      for (const auto& [key, value] :
           json["override_default_implementation"].items()) {
        if (!value.is_string()) {
          throw std::invalid_argument("Default implementation override must "
                                      "be a string in architecture spec");
        }
        overrides.emplace(locusFromString(key), value.get<std::string>());
      }
    } else {
      throw std::invalid_argument("Default implementation overrides must be "
                                  "an object in architecture spec");
    }
  }
  return {std::move(implementations), std::move(defaultImplementation),
          std::move(overrides)};
}

auto GateInfo::findImplementation(const std::string& name) const
    -> const GateImplementationInfo* {
  if (const auto it = implementations_.find(name);
      it != implementations_.end()) {
    return &it->second;
  }
  return nullptr;
}

auto GateInfo::defaultImplementationFor(const Locus& locus) const
    -> const std::string& {
  if (const auto it = overrideDefaultImplementation_.find(locus);
      it != overrideDefaultImplementation_.end()) {
    return it->second;
  }
  return defaultImplementation_;
}

Architecture::Architecture(std::string calibrationSetId,
                           std::vector<Component> qubits,
                           std::vector<Component> computationalResonators,
                           std::map<std::string, GateInfo> gates)
    : calibrationSetId_(std::move(calibrationSetId)),
      qubits_(std::move(qubits)),
      computationalResonators_(std::move(computationalResonators)),
      gates_(std::move(gates)) {
  for (const auto& qubit : qubits_) {
    if (!qubitSet_.emplace(qubit).second) {
      throw std::invalid_argument("Qubit " + qubit +
                                  " is listed more than once");
    }
  }
  for (const auto& resonator : computationalResonators_) {
    if (qubitSet_.contains(resonator)) {
      throw std::invalid_argument("Component " + resonator +
                                  " is both a qubit and a resonator");
    }
    if (!resonatorSet_.emplace(resonator).second) {
      throw std::invalid_argument("Computational resonator " + resonator +
                                  " is listed more than once");
    }
  }
  components_.insert(qubitSet_.cbegin(), qubitSet_.cend());
  components_.insert(resonatorSet_.cbegin(), resonatorSet_.cend());
  for (const auto& [name, gate] : gates_) {
    for (const auto& [implName, impl] : gate.getImplementations()) {
      for (const auto& locus : impl.loci) {
        const auto unknown =
            std::ranges::find_if(locus, [this](const Component& c) {
              return !components_.contains(c);
            });
        if (unknown != locus.end()) {
          throw std::invalid_argument("Locus (" + locusToString(locus) +
                                      ") of " + name + "." + implName +
                                      " names unknown component " + *unknown);
        }
      }
    }
  }
}

auto Architecture::fromJSON(const nlohmann::json& json) -> Architecture {
  if (!json.is_object()) {
    throw std::invalid_argument("Architecture spec must be a JSON object");
  }
  // JSON Example:
  // "calibration_set_id": "26c5e70f-bea0-43af-bd37-6212ec7d04cb"
  std::string calibrationSetId;
  if (json.contains("calibration_set_id")) {
    if (json["calibration_set_id"].is_string()) {
      calibrationSetId = json["calibration_set_id"];
    } else {
      throw std::invalid_argument(
          "Calibration set id must be a string in architecture spec");
    }
  } else {
    throw std::invalid_argument(
        "Calibration set id is missed in architecture spec");
  }
  std::vector<Component> qubits;
  if (json.contains("qubits")) {
    qubits = componentsFromJSON(json["qubits"], "Qubits");
  } else {
    throw std::invalid_argument("Qubits are missed in architecture spec");
  }
  std::vector<Component> resonators;
  if (json.contains("computational_resonators")) {
    resonators = componentsFromJSON(json["computational_resonators"],
                                    "Computational resonators");
  } else {
    SPDLOG_WARN("Computational resonators are missed in architecture spec. "
                "Assuming the architecture has none.");
  }
  // JSON Example:
  // "gates": {
  //   "prx": {
  //     "implementations": {"drag_gaussian": {"loci": [["QB1"], ["QB2"]]}},
  //     "default_implementation": "drag_gaussian",
  //     "override_default_implementation": {}
  //   }
  // }
  std::map<std::string, GateInfo> gates;
  if (json.contains("gates")) {
    if (json["gates"].is_object()) {
      for (const auto& [name, gateSpec] : json["gates"].items()) {
        try {
          gates.emplace(name, GateInfo::fromJSON(gateSpec));
        } catch (const std::invalid_argument& e) {
          throw std::invalid_argument("Gate '" + name + "': " + e.what());
        }
      }
    } else {
      throw std::invalid_argument("Gates must be an object in architecture "
                                  "spec");
    }
  } else {
    throw std::invalid_argument("Gates are missed in architecture spec");
  }
  return {std::move(calibrationSetId), std::move(qubits),
          std::move(resonators), std::move(gates)};
}

auto Architecture::fromJSONString(const std::string_view json)
    -> Architecture {
  return fromJSON(nlohmann::json::parse(json));
}

auto Architecture::fromJSONFile(const std::string& filename) -> Architecture {
  std::ifstream architectureFile(filename);
  if (!architectureFile.is_open()) {
    throw std::runtime_error("Could not open file " + filename);
  }
  nlohmann::json jsonData;
  try {
    architectureFile >> jsonData;
  } catch (const std::exception& e) {
    throw std::runtime_error("Could not parse JSON file " + filename + ": " +
                             e.what());
  }
  return fromJSON(jsonData);
}

auto Architecture::findGate(const std::string& name) const -> const GateInfo* {
  if (const auto it = gates_.find(name); it != gates_.end()) {
    return &it->second;
  }
  return nullptr;
}
} // namespace dqa
