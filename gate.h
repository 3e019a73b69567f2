/**
 * @file qbm/gate/gate.h
 * @brief Single include point of the qbm-gate module.
 *
 * @code
 * #include <qbm/gate/gate.h>
 * using namespace qb::gate;
 *
 * Router router({rules::path(), rules::method(), rules::content_type()},
 *               {{{PathPattern{"/items"}, "POST", "json"},
 *                 validation::JsonParser(create_item, item_filter)}});
 * ErrorHandler app(router);
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include "./types.h"
#include "./error.h"
#include "./request.h"
#include "./response.h"
#include "./routing.h"
#include "./validation.h"
#include "./middleware/error_handler.h"
#include "./middleware/basic_auth.h"

/**
 * @namespace qb::gate
 * @brief Rule-chain routing, JSON-shape validation and request wrappers for qb.
 */
