/*
 * Copyright (c) 2023 - 2026 Chair for Design Automation, TUM
 * Copyright (c) 2025 - 2026 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "dqa/Definitions.hpp"

#include <sstream>
#include <string>

namespace dqa {
auto locusToString(const Locus& locus, const std::string& separator)
    -> std::string {
  std::ostringstream ss;
  for (auto it = locus.cbegin(); it != locus.cend(); ++it) {
    if (it != locus.cbegin()) {
      ss << separator;
    }
    ss << *it;
  }
  return ss.str();
}

auto locusFromString(const std::string& str, const char separator) -> Locus {
  Locus locus;
  std::istringstream iss(str);
  std::string component;
  while (std::getline(iss, component, separator)) {
    locus.emplace_back(component);
  }
  return locus;
}
} // namespace dqa
