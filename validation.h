/**
 * @file qbm/gate/validation.h
 * @brief Main convenience header for the qbm-gate validation system.
 *
 * Includes the JSON-shape filters (`validation::IFilter` and its factories) and the
 * `validation::JsonParser` handler wrapper that applies them to request bodies.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include "./validation/filter.h"      // Filters, Verdict and the filter:: factories.
#include "./validation/json_parser.h" // JsonParser, validate() and parse_and_validate().
