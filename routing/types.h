/**
 * @file qbm/gate/routing/types.h
 * @brief Common type aliases for the gate routing system.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <functional> // For std::function

#include "../response.h"

namespace qb::gate {
    class Context;

    /**
     * @brief Signature of anything that can serve a request: a route handler, a `Router`,
     *        or a wrapper such as `JsonParser`, `BasicAuth` or `ErrorHandler`.
     *
     * Failures are reported by throwing `HttpError`.
     */
    using Handler = std::function<Response(Context &)>;
} // namespace qb::gate
