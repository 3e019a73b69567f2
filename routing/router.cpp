/**
 * @file qbm/gate/routing/router.cpp
 * @brief Implementation of the rule-chain `Router`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./router.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "../logger.h"

namespace qb::gate {

namespace {
    struct Candidate {
        const Route *route;
        PathArguments arguments;
    };
} // namespace

Router::Router(RuleList rules, RouteTable table)
    : _rules(std::move(rules)), _table(std::move(table)) {
    for (std::size_t i = 0; i < _rules.size(); ++i) {
        if (!_rules[i]) {
            throw std::invalid_argument("Router: rule #" + std::to_string(i) + " is null.");
        }
    }
    for (const auto &route : _table) {
        if (route.key.size() != _rules.size()) {
            throw std::invalid_argument("Router: route " + route.str() + " has " +
                                        std::to_string(route.key.size()) + " values, expected " +
                                        std::to_string(_rules.size()) + ".");
        }
        for (std::size_t i = 0; i < _rules.size(); ++i) {
            if (!_rules[i]->accepts(route.key[i])) {
                throw std::invalid_argument("Router: rule '" + _rules[i]->name() + "' does not accept value '" +
                                            to_string(route.key[i]) + "' of route " + route.str() + ".");
            }
        }
    }
}

RouteMatch Router::match(const Request &request) const {
    LOG_GATE_TRACE_REQ(request, "routing through " << _rules.size() << " rules, " << _table.size() << " routes");

    std::vector<Candidate> candidates;
    candidates.reserve(_table.size());
    for (const auto &route : _table)
        candidates.push_back({&route, {}});

    for (std::size_t dim = 0; dim < _rules.size(); ++dim) {
        const IRule &rule = *_rules[dim];
        std::vector<Candidate> survivors;
        std::vector<const RuleValue *> rejected;

        for (auto &candidate : candidates) {
            if (rule.check(request, candidate.route->key[dim], candidate.arguments))
                survivors.push_back(std::move(candidate));
            else
                rejected.push_back(&candidate.route->key[dim]);
        }

        if (survivors.empty()) {
            LOG_GATE_DEBUG_REQ(request, "every candidate rejected by rule '" << rule.name() << "'");
            throw rule.error_for(request, rejected);
        }
        candidates = std::move(survivors);
    }

    if (candidates.empty()) {
        // no rules and no routes
        throw error::route_not_found();
    }
    if (candidates.size() > 1) {
        LOG_GATE_WARN_REQ(request, "ambiguous, " << candidates.size() << " routes match, using "
                                   << candidates.front().route->str());
    }

    LOG_GATE_DEBUG_REQ(request, "matched " << candidates.front().route->str());
    return {candidates.front().route, std::move(candidates.front().arguments)};
}

Response Router::handle(Context &ctx) const {
    RouteMatch found = match(ctx.request());
    ctx.set_path_arguments(std::move(found.arguments));
    return found.route->handler(ctx);
}

} // namespace qb::gate
