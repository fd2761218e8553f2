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

#include <map>
#include <set>
#include <string>
#include <vector>

namespace dqa {
/**
 * @brief Name of an addressable component of the QPU.
 * @details Either a qubit (e.g., "QB1") or a computational resonator (e.g.,
 * "CR1"). Names are unique across both kinds.
 */
using Component = std::string;
using Components = std::set<Component>;
/**
 * @brief Ordered tuple of components an operation acts on.
 * @details The order is significant, e.g., for MOVE the first entry is the
 * qubit and the second one the resonator.
 */
using Locus = std::vector<Component>;
using Loci = std::vector<Locus>;
/**
 * @brief Mapping from logical qubit names (used in the circuits) to physical
 * component names (known to the architecture).
 */
using QubitMapping = std::map<std::string, Component>;

/// Joins the components of a locus with the given separator.
[[nodiscard]] auto locusToString(const Locus& locus,
                                 const std::string& separator = ", ")
    -> std::string;
/// Splits a separator-joined string into a locus.
[[nodiscard]] auto locusFromString(const std::string& str, char separator = ',')
    -> Locus;
} // namespace dqa
