/**
 * @file qbm/gate/routing.h
 * @brief Main convenience header for the qbm-gate routing system.
 *
 * Includes everything needed to declare routes and dispatch requests: path patterns and
 * their converters, the routing rules, the route table and the `Router` itself.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include "./routing/types.h"          // Handler signature.
#include "./routing/context.h"        // Request-scoped Context.
#include "./routing/path_arguments.h" // Values captured from the path.
#include "./routing/converter.h"      // Segment converters (int, float, str).
#include "./routing/path_pattern.h"   // Literal/converter path patterns.
#include "./routing/rule.h"           // IRule and the path, method and content-type rules.
#include "./routing/route_table.h"    // Route and RouteTable.
#include "./routing/router.h"         // The rule-chain Router.
