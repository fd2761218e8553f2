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
#include "dqa/Circuit.hpp"
#include "dqa/CircuitValidationError.hpp"
#include "dqa/CircuitValidator.hpp"
#include "dqa/Definitions.hpp"
#include "dqa/MoveValidator.hpp"

#include <exception>
#include <optional>
// The header <nlohmann/json.hpp> is used, but clang-tidy confuses it with the
// wrong forward header <nlohmann/json_fwd.hpp>
// NOLINTNEXTLINE(misc-include-cleaner)
#include <nlohmann/json.hpp>
#include <pybind11/attr.h>
#include <pybind11/cast.h>
#include <pybind11/detail/common.h>
#include <pybind11/gil_safe_call_once.h>
#include <pybind11/native_enum.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
// NOLINTNEXTLINE(misc-include-cleaner)
#include <pybind11_json/pybind11_json.hpp>
#include <spdlog/common.h>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace pybind11::literals;

PYBIND11_MODULE(DQA_MODULE_NAME, m, py::mod_gil_not_used()) {
  //===--------------------------------------------------------------------===//
  // Dynamic Quantum Architecture
  //===--------------------------------------------------------------------===//
  py::class_<dqa::Architecture> architecture(m, "DynamicQuantumArchitecture");
  architecture.def_static("from_json_file", &dqa::Architecture::fromJSONFile,
                          "filename"_a);
  architecture.def_static("from_json_string",
                          &dqa::Architecture::fromJSONString, "json"_a);
  architecture.def_static(
      "from_dict",
      [](const nlohmann::json& json) -> dqa::Architecture {
        return dqa::Architecture::fromJSON(json);
      },
      "spec"_a);
  architecture.def_property_readonly("calibration_set_id",
                                     &dqa::Architecture::getCalibrationSetId);
  architecture.def_property_readonly("qubits", &dqa::Architecture::getQubits);
  architecture.def_property_readonly(
      "computational_resonators",
      &dqa::Architecture::getComputationalResonators);
  architecture.def_property_readonly(
      "gates", [](const dqa::Architecture& self) -> std::vector<std::string> {
        std::vector<std::string> names;
        for (const auto& [name, gate] : self.getGates()) {
          names.emplace_back(name);
        }
        return names;
      });

  //===--------------------------------------------------------------------===//
  // MOVE Gate Validation Mode Enum
  //===--------------------------------------------------------------------===//
  py::native_enum<dqa::MoveValidator::Config::Mode>(
      m, "MoveGateValidationMode", "enum.Enum")
      .value("none", dqa::MoveValidator::Config::Mode::NONE)
      .value("strict", dqa::MoveValidator::Config::Mode::STRICT)
      .value("allow_prx", dqa::MoveValidator::Config::Mode::ALLOW_PRX)
      .export_values()
      .finalize();

  //===--------------------------------------------------------------------===//
  // Validation Error
  //===--------------------------------------------------------------------===//
  PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object>
      circuitValidationError;
  circuitValidationError.call_once_and_store_result([&m]() -> py::object {
    return py::exception<dqa::CircuitValidationError>(
        m, "CircuitValidationError", PyExc_ValueError);
  });
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) {
        std::rethrow_exception(p);
      }
    } catch (const dqa::CircuitValidationError& e) {
      // the structured failure travels as the second argument
      const py::object details = e.toJSON();
      py::set_error(circuitValidationError.get_stored(),
                    py::make_tuple(e.what(), details));
    }
  });

  //===--------------------------------------------------------------------===//
  // Circuit Validator
  //===--------------------------------------------------------------------===//
  py::class_<dqa::CircuitValidator> circuitValidator(m, "CircuitValidator");
  {
    const dqa::CircuitValidator::Config defaultConfig;
    circuitValidator.def(
        py::init([](const dqa::Architecture& arch, const std::string& logLevel,
                    const dqa::MoveValidator::Config::Mode moveGateValidation,
                    const bool mustCloseSandwiches,
                    const std::vector<std::string>&
                        additionalSandwichOperations)
                     -> dqa::CircuitValidator {
          dqa::CircuitValidator::Config config;
          config.logLevel = spdlog::level::from_str(logLevel);
          config.moveValidatorConfig = {
              .mode = moveGateValidation,
              .mustCloseSandwiches = mustCloseSandwiches,
              .additionalSandwichOperations = additionalSandwichOperations};
          return {arch, config};
        }),
        py::keep_alive<1, 2>(), "arch"_a,
        "log_level"_a = spdlog::level::to_short_c_str(defaultConfig.logLevel),
        "move_gate_validation"_a = defaultConfig.moveValidatorConfig.mode,
        "must_close_sandwiches"_a =
            defaultConfig.moveValidatorConfig.mustCloseSandwiches,
        "additional_sandwich_operations"_a =
            defaultConfig.moveValidatorConfig.additionalSandwichOperations);
  }
  circuitValidator.def_static(
      "from_json_string",
      [](const dqa::Architecture& arch,
         const std::string& json) -> dqa::CircuitValidator {
        // The correct header <nlohmann/json.hpp> is included, but clang-tidy
        // confuses it with the wrong forward header <nlohmann/json_fwd.hpp>
        // NOLINTNEXTLINE(misc-include-cleaner)
        return {arch, nlohmann::json::parse(json)
                          .get<dqa::CircuitValidator::Config>()};
      },
      py::keep_alive<0, 1>(), "arch"_a, "json"_a);
  circuitValidator.def(
      "validate",
      [](const dqa::CircuitValidator& self, const nlohmann::json& circuits,
         const std::optional<nlohmann::json>& qubitMapping) -> void {
        std::optional<dqa::QubitMapping> mapping;
        if (qubitMapping.has_value() && !qubitMapping->is_null()) {
          mapping = dqa::qubitMappingFromJSON(*qubitMapping);
        }
        self.validate(dqa::circuitBatchFromJSON(circuits), mapping);
      },
      "circuits"_a, "qubit_mapping"_a = py::none());
}
