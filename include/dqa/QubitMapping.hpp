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

#include <optional>

namespace dqa {
/**
 * @brief Translates a locus from logical to physical qubit names.
 * @details Without a mapping the locus is returned unchanged, i.e., the
 * circuit is assumed to use physical names already. This is the only place
 * where the mapping is applied, such that all checks see the same physical
 * view of a circuit.
 * @param locus is the locus as written in an instruction
 * @param mapping is the optional logical to physical mapping
 * @return the physical locus
 * @throw CircuitValidationError If a qubit of the locus is not mapped.
 */
[[nodiscard]] auto mapLocus(const Locus& locus,
                            const std::optional<QubitMapping>& mapping)
    -> Locus;

/**
 * @brief Checks that the mapping can be applied to all circuits of the batch.
 * @details The mapping must be injective, contain every qubit used in any of
 * the circuits, and map only to components of the architecture. The checks
 * are performed in this order and the first violation is reported. Without a
 * mapping nothing is checked.
 * @throw CircuitValidationError If one of the checks fails.
 */
auto validateQubitMapping(const Architecture& architecture,
                          const CircuitBatch& circuits,
                          const std::optional<QubitMapping>& mapping) -> void;
} // namespace dqa
