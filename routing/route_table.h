/**
 * @file qbm/gate/routing/route_table.h
 * @brief Defines `Route` and `RouteTable`, the insertion-ordered set of routes a `Router` dispatches to.
 *
 * A route is a key, made of one `RuleValue` per router dimension, and a handler.
 *
 * @code
 * RouteTable table{
 *     {{PathPattern{"/create"}, "POST", "json"}, create_handler},
 *     {{PathPattern{"/", converters::integer(), "/options"}, "GET", none}, options_handler},
 * };
 * @endcode
 *
 * The table is built once and is read-only afterwards. Registration order is significant:
 * when several routes survive every dimension, the first registered wins.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <cstddef>          // For std::size_t
#include <initializer_list> // For std::initializer_list
#include <string>           // For std::string
#include <vector>           // For std::vector

#include "./rule.h"
#include "./types.h"

namespace qb::gate {
    /**
     * @brief One entry of a `RouteTable`.
     */
    struct Route {
        std::vector<RuleValue> key; ///< One value per router dimension, in dimension order.
        Handler handler; ///< What serves requests matched to this route.

        /** @brief Printable key, e.g. "(/create, POST, json)". */
        [[nodiscard]] std::string str() const;
    };

    /**
     * @brief Insertion-ordered list of routes with unique keys.
     */
    class RouteTable {
    private:
        std::vector<Route> _routes;

    public:
        RouteTable() = default;

        /**
         * @brief Builds a table from a list of routes, in order.
         * @throws std::invalid_argument on a null handler or a duplicate key.
         */
        RouteTable(std::initializer_list<Route> routes);

        /**
         * @brief Appends a route.
         * @param key One value per router dimension.
         * @param handler The route's handler.
         * @return `*this` for chaining.
         * @throws std::invalid_argument if `handler` is empty or `key` is already registered.
         */
        RouteTable &add(std::vector<RuleValue> key, Handler handler);

        [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }
        [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }
        [[nodiscard]] const Route &operator[](std::size_t index) const noexcept { return _routes[index]; }
        [[nodiscard]] auto begin() const noexcept { return _routes.begin(); }
        [[nodiscard]] auto end() const noexcept { return _routes.end(); }
    };
} // namespace qb::gate
