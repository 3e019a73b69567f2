/**
 * @file qbm/gate/routing/route_table.cpp
 * @brief Implementation of `Route` and `RouteTable`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./route_table.h"

#include <stdexcept>

namespace qb::gate {

std::string Route::str() const {
    std::string out = "(";
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i)
            out += ", ";
        out += to_string(key[i]);
    }
    out += ')';
    return out;
}

RouteTable::RouteTable(std::initializer_list<Route> routes) {
    _routes.reserve(routes.size());
    for (const auto &route : routes)
        add(route.key, route.handler);
}

RouteTable &RouteTable::add(std::vector<RuleValue> key, Handler handler) {
    Route route{std::move(key), std::move(handler)};
    if (!route.handler) {
        throw std::invalid_argument("RouteTable: route " + route.str() + " has no handler.");
    }
    for (const auto &existing : _routes) {
        if (existing.key == route.key) {
            throw std::invalid_argument("RouteTable: route " + route.str() + " is registered twice.");
        }
    }
    _routes.push_back(std::move(route));
    return *this;
}

} // namespace qb::gate
