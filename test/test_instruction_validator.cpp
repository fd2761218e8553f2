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
#include "dqa/Definitions.hpp"
#include "dqa/InstructionValidator.hpp"
#include "dqa/QubitMapping.hpp"

#include <gmock/gmock-matchers.h>
#include <gmock/gmock-more-matchers.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace dqa {
namespace {
using Reason = CircuitValidationError::Reason;

auto failsWith(const Reason reason) {
  return ::testing::Throws<CircuitValidationError>(
      ::testing::Property(&CircuitValidationError::getReason, reason));
}

auto prx(const std::string& qubit) -> Instruction {
  return {"prx", {qubit}, {{"angle", 0.5}, {"phase", 0.25}}};
}
} // namespace

constexpr std::string_view twoQubitArchitecture = R"({
  "calibration_set_id": "two-qubits",
  "qubits": ["QB1", "QB2"],
  "gates": {
    "prx": {
      "implementations": {"drag_gaussian": {"loci": [["QB1"], ["QB2"]]}},
      "default_implementation": "drag_gaussian"
    },
    "cz": {
      "implementations": {"tgss": {"loci": [["QB1", "QB2"]]}},
      "default_implementation": "tgss"
    }
  }
})";

class InstructionValidatorTest : public ::testing::Test {
protected:
  Architecture architecture_ =
      Architecture::fromJSONFile("architectures/crystal_5.json");
  InstructionValidator validator_{architecture_};
};

//===----------------------------------------------------------------------===//
// Static checks
//===----------------------------------------------------------------------===//

TEST(InstructionValidatorStaticTest, ReturnsDescriptor) {
  const auto& op = InstructionValidator::validateStatic(prx("QB1"));
  EXPECT_EQ(op.name, "prx");
  const auto& alias = InstructionValidator::validateStatic(
      {"phased_rx", {"QB1"}, {{"angle", 0.5}, {"phase", 0.25}}});
  EXPECT_EQ(alias.canonicalName(), "prx");
}

TEST(InstructionValidatorStaticTest, UnknownOperation) {
  EXPECT_THAT(
      [] {
        std::ignore =
            InstructionValidator::validateStatic({"cnot", {"QB1", "QB2"}});
      },
      failsWith(Reason::UNKNOWN_OPERATION));
}

TEST(InstructionValidatorStaticTest, Arity) {
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic({"cz", {"QB1"}});
      },
      failsWith(Reason::INVALID_ARITY));
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"prx", {"QB1", "QB2"}, {{"angle", 0.5}, {"phase", 0.25}}});
      },
      failsWith(Reason::INVALID_ARITY));
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic({"barrier", {}});
      },
      failsWith(Reason::INVALID_ARITY));
  EXPECT_THAT(
      [] {
        std::ignore =
            InstructionValidator::validateStatic({"cz", {"QB1", "QB1"}});
      },
      failsWith(Reason::INVALID_ARITY));
  EXPECT_NO_THROW(std::ignore = InstructionValidator::validateStatic(
                      {"barrier", {"QB1", "QB2", "QB3", "QB4"}}));
  EXPECT_NO_THROW(std::ignore = InstructionValidator::validateStatic(
                      {"measure", {"QB1", "QB2", "QB3"}, {{"key", "m"}}}));
}

TEST(InstructionValidatorStaticTest, Arguments) {
  // missing phase
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"prx", {"QB1"}, {{"angle", 0.5}}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
  // wrongly typed angle
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"prx", {"QB1"}, {{"angle", "pi"}, {"phase", 0.25}}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
  // unknown argument
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"cz", {"QB1", "QB2"}, {{"angle", 0.5}}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
  // arguments must form an object
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"cz", {"QB1", "QB2"}, nlohmann::json::array()});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
  // missing measurement key
  EXPECT_THAT(
      [] {
        std::ignore =
            InstructionValidator::validateStatic({"measure", {"QB1"}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"delay", {"QB1"}, {{"duration", "long"}}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
}

TEST(InstructionValidatorStaticTest, OptionalArguments) {
  EXPECT_NO_THROW(
      std::ignore = InstructionValidator::validateStatic(
          {"measure", {"QB1"}, {{"key", "m"}, {"feedback_key", "f"}}}));
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"measure", {"QB1"}, {{"key", "m"}, {"feedback_key", 1}}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
  // the deprecated alias knows no feedback
  EXPECT_THAT(
      [] {
        std::ignore = InstructionValidator::validateStatic(
            {"measurement", {"QB1"}, {{"key", "m"}, {"feedback_key", "f"}}});
      },
      failsWith(Reason::INVALID_ARGUMENTS));
}

//===----------------------------------------------------------------------===//
// Architecture checks
//===----------------------------------------------------------------------===//

TEST_F(InstructionValidatorTest, UnknownOperation) {
  EXPECT_THAT([this] { validator_.validate({"cnot", {"QB1"}}, std::nullopt); },
              failsWith(Reason::UNKNOWN_OPERATION));
}

TEST_F(InstructionValidatorTest, UnsupportedOperation) {
  try {
    validator_.validate({"reset", {"QB1"}}, std::nullopt);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::UNSUPPORTED_OPERATION);
    EXPECT_EQ(e.getContext().operation, "reset");
  }
}

TEST_F(InstructionValidatorTest, DefaultImplementation) {
  EXPECT_NO_THROW(validator_.validate(prx("QB1"), std::nullopt));
  // only calibrated by the non-default implementation
  EXPECT_NO_THROW(validator_.validate(prx("QB5"), std::nullopt));
}

TEST_F(InstructionValidatorTest, ExplicitImplementation) {
  auto instruction = prx("QB5");
  instruction.implementation = "drag_crf";
  EXPECT_NO_THROW(validator_.validate(instruction, std::nullopt));
  instruction.implementation = "drag_gaussian";
  try {
    validator_.validate(instruction, std::nullopt);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::LOCUS_NOT_ALLOWED);
    EXPECT_EQ(e.getContext().operation, "prx.drag_gaussian");
  }
}

TEST_F(InstructionValidatorTest, UnsupportedImplementation) {
  auto instruction = prx("QB1");
  instruction.implementation = "slepian";
  try {
    validator_.validate(instruction, std::nullopt);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::UNSUPPORTED_IMPLEMENTATION);
    EXPECT_EQ(e.getContext().operation, "prx.slepian");
  }
}

TEST_F(InstructionValidatorTest, SymmetricLocus) {
  EXPECT_NO_THROW(validator_.validate({"cz", {"QB1", "QB2"}}, std::nullopt));
  EXPECT_NO_THROW(validator_.validate({"cz", {"QB2", "QB1"}}, std::nullopt));
  EXPECT_THAT(
      [this] { validator_.validate({"cz", {"QB1", "QB3"}}, std::nullopt); },
      failsWith(Reason::LOCUS_NOT_ALLOWED));
  EXPECT_THAT(
      [this] { validator_.validate({"cz", {"QB3", "QB1"}}, std::nullopt); },
      failsWith(Reason::LOCUS_NOT_ALLOWED));
}

TEST_F(InstructionValidatorTest, SymmetricLocusOfImplementation) {
  EXPECT_NO_THROW(
      validator_.validate({"cz", {"QB5", "QB4"}, {}, "crf"}, std::nullopt));
  EXPECT_THAT(
      [this] {
        validator_.validate({"cz", {"QB1", "QB2"}, {}, "crf"}, std::nullopt);
      },
      failsWith(Reason::LOCUS_NOT_ALLOWED));
}

TEST_F(InstructionValidatorTest, ExactLocus) {
  const auto star = Architecture::fromJSONFile("architectures/star_6.json");
  const InstructionValidator validator(star);
  EXPECT_NO_THROW(validator.validate({"move", {"QB3", "CR1"}}, std::nullopt));
  EXPECT_THAT(
      [&validator] {
        validator.validate({"move", {"CR1", "QB3"}}, std::nullopt);
      },
      failsWith(Reason::LOCUS_NOT_ALLOWED));
  EXPECT_THAT(
      [&validator] {
        validator.validate({"move", {"QB3", "CR2"}}, std::nullopt);
      },
      failsWith(Reason::LOCUS_NOT_ALLOWED));
}

TEST_F(InstructionValidatorTest, FactorizableLocus) {
  // the tuple itself is never declared, only its components
  EXPECT_NO_THROW(validator_.validate(
      {"measure", {"QB5", "QB1", "QB3"}, {{"key", "m"}}}, std::nullopt));
  try {
    validator_.validate({"measure", {"QB1", "QB6"}, {{"key", "m"}}},
                        std::nullopt);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::LOCUS_NOT_ALLOWED);
    EXPECT_THAT(e.getContext().components, ::testing::ElementsAre("QB6"));
  }
}

TEST_F(InstructionValidatorTest, ConditionalRotation) {
  auto instruction =
      Instruction{"cc_prx",
                  {"QB2"},
                  {{"angle", 0.5},
                   {"phase", 0.0},
                   {"feedback_qubit", "QB1"},
                   {"feedback_key", "f"}}};
  EXPECT_NO_THROW(validator_.validate(instruction, std::nullopt));
  instruction.qubits = {"QB3"};
  EXPECT_THAT([&] { validator_.validate(instruction, std::nullopt); },
              failsWith(Reason::LOCUS_NOT_ALLOWED));
}

TEST_F(InstructionValidatorTest, DeprecatedAliases) {
  EXPECT_NO_THROW(validator_.validate(
      {"phased_rx", {"QB2"}, {{"angle", 0.5}, {"phase", 0.25}}},
      std::nullopt));
  EXPECT_NO_THROW(validator_.validate(
      {"measurement", {"QB2", "QB4"}, {{"key", "m"}}}, std::nullopt));
}

TEST_F(InstructionValidatorTest, NoCalibrationNeeded) {
  EXPECT_NO_THROW(validator_.validate({"barrier", {"QB1", "QB3", "QB5"}},
                                      std::nullopt));
  EXPECT_NO_THROW(validator_.validate(
      {"delay", {"QB4"}, {{"duration", 80e-9}}}, std::nullopt));
  // not listed in the gates of the architecture, available nevertheless
  EXPECT_NO_THROW(validator_.validate({"reset_wait", {"QB2"}}, std::nullopt));
}

TEST(InstructionValidatorScenarioTest, ComponentMissingFromArchitecture) {
  const auto architecture = Architecture::fromJSONString(twoQubitArchitecture);
  const InstructionValidator validator(architecture);
  EXPECT_NO_THROW(validator.validate({"barrier", {"QB1"}}, std::nullopt));
  try {
    validator.validate({"barrier", {"QB1", "QB3"}}, std::nullopt);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::LOCUS_NOT_ALLOWED);
    EXPECT_THAT(e.getContext().components, ::testing::ElementsAre("QB3"));
    EXPECT_THAT(e.what(), ::testing::HasSubstr("QB3"));
  }
  EXPECT_NO_THROW(validator.validate(prx("QB1"), std::nullopt));
  try {
    validator.validate(prx("QB3"), std::nullopt);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::LOCUS_NOT_ALLOWED);
    EXPECT_THAT(e.getContext().locus, ::testing::ElementsAre("QB3"));
  }
}

TEST(InstructionValidatorScenarioTest, SymmetricGate) {
  const auto architecture = Architecture::fromJSONString(twoQubitArchitecture);
  const InstructionValidator validator(architecture);
  EXPECT_NO_THROW(validator.validate({"cz", {"QB2", "QB1"}}, std::nullopt));
  EXPECT_THAT(
      [&validator] {
        validator.validate({"cz", {"QB1", "QB3"}}, std::nullopt);
      },
      failsWith(Reason::LOCUS_NOT_ALLOWED));
}

//===----------------------------------------------------------------------===//
// Qubit mapping
//===----------------------------------------------------------------------===//

TEST_F(InstructionValidatorTest, MappedLocus) {
  const QubitMapping mapping{{"q0", "QB1"}, {"q1", "QB2"}, {"q2", "QB3"}};
  EXPECT_NO_THROW(validator_.validate({"cz", {"q1", "q0"}}, mapping));
  try {
    validator_.validate({"cz", {"q0", "q2"}}, mapping);
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::LOCUS_NOT_ALLOWED);
    EXPECT_THAT(e.getContext().locus, ::testing::ElementsAre("q0", "q2"));
    ASSERT_TRUE(e.getContext().mappedLocus.has_value());
    EXPECT_THAT(*e.getContext().mappedLocus,
                ::testing::ElementsAre("QB1", "QB3"));
    EXPECT_EQ(e.getContext().operation, "cz");
    EXPECT_EQ(e.getDetail(),
              "(q0, q2) = (QB1, QB3) is not allowed as locus for 'cz'.");
  }
}

TEST_F(InstructionValidatorTest, UnmappedQubit) {
  const QubitMapping mapping{{"q0", "QB1"}};
  EXPECT_THAT([&] { validator_.validate({"cz", {"q0", "q1"}}, mapping); },
              failsWith(Reason::UNMAPPED_QUBITS));
}

TEST_F(InstructionValidatorTest, MappingIsTransparent) {
  const QubitMapping mapping{
      {"a", "QB4"}, {"b", "QB3"}, {"c", "QB1"}, {"d", "QB5"}};
  const std::vector<Instruction> instructions{
      {"cz", {"a", "b"}},
      {"cz", {"b", "c"}},
      {"cz", {"d", "a"}, {}, "crf"},
      {"cz", {"a", "b"}, {}, "tgss"},
      prx("c"),
      prx("d"),
      {"prx", {"d"}, {{"angle", 0.5}, {"phase", 0.25}}, "drag_gaussian"},
      {"measure", {"a", "b", "c", "d"}, {{"key", "m"}}},
      {"barrier", {"d", "c"}},
      {"cc_prx",
       {"c"},
       {{"angle", 0.5},
        {"phase", 0.0},
        {"feedback_qubit", "a"},
        {"feedback_key", "f"}}},
      {"cc_prx",
       {"b"},
       {{"angle", 0.5},
        {"phase", 0.0},
        {"feedback_qubit", "a"},
        {"feedback_key", "f"}}}};
  for (const auto& instruction : instructions) {
    auto physical = instruction;
    physical.qubits = mapLocus(instruction.qubits, mapping);
    bool mappedValid = true;
    bool physicalValid = true;
    try {
      validator_.validate(instruction, mapping);
    } catch (const CircuitValidationError&) {
      mappedValid = false;
    }
    try {
      validator_.validate(physical, std::nullopt);
    } catch (const CircuitValidationError&) {
      physicalValid = false;
    }
    EXPECT_EQ(mappedValid, physicalValid) << instruction;
  }
}

//===----------------------------------------------------------------------===//
// Measurement keys
//===----------------------------------------------------------------------===//

TEST(MeasurementKeyCheckerTest, UniqueKeys) {
  MeasurementKeyChecker checker;
  EXPECT_NO_THROW(checker.check({"measure", {"QB1"}, {{"key", "m0"}}}));
  EXPECT_NO_THROW(checker.check({"measure", {"QB2"}, {{"key", "m1"}}}));
  // only measurements carry keys
  EXPECT_NO_THROW(checker.check({"cz", {"QB1", "QB2"}}));
  EXPECT_NO_THROW(checker.check({"barrier", {"QB1"}, {{"key", "m0"}}}));
}

TEST(MeasurementKeyCheckerTest, DuplicateKey) {
  MeasurementKeyChecker checker;
  checker.check({"measure", {"QB1"}, {{"key", "m0"}}});
  try {
    checker.check({"measure", {"QB2"}, {{"key", "m0"}}});
    FAIL() << "Expected CircuitValidationError";
  } catch (const CircuitValidationError& e) {
    EXPECT_EQ(e.getReason(), Reason::DUPLICATE_MEASUREMENT_KEY);
    EXPECT_THAT(e.what(), ::testing::HasSubstr("'m0'"));
  }
}

TEST(MeasurementKeyCheckerTest, AliasesShareKeys) {
  MeasurementKeyChecker checker;
  checker.check({"measurement", {"QB1"}, {{"key", "m0"}}});
  EXPECT_THAT(
      [&checker] { checker.check({"measure", {"QB2"}, {{"key", "m0"}}}); },
      failsWith(Reason::DUPLICATE_MEASUREMENT_KEY));
}

TEST(MeasurementKeyCheckerTest, MissingKey) {
  MeasurementKeyChecker checker;
  EXPECT_THAT([&checker] { checker.check({"measure", {"QB1"}}); },
              failsWith(Reason::INVALID_ARGUMENTS));
  EXPECT_THAT(
      [&checker] { checker.check({"measure", {"QB1"}, {{"key", 0}}}); },
      failsWith(Reason::INVALID_ARGUMENTS));
}
} // namespace dqa
