/**
 * @file qbm/gate/routing/router.h
 * @brief Defines the `Router`, which dispatches requests through an ordered chain of rules.
 *
 * A router is built from an ordered list of rules (its dimensions) and a `RouteTable` whose
 * keys hold one value per dimension. Routing starts with every route as a candidate and,
 * rule after rule, keeps only the candidates whose value the request satisfies. The first
 * rule that leaves no candidate decides the error: with `[path, method, content_type]`
 * a request reaching a known path with the wrong method is a 405, whatever its content type.
 *
 * @code
 * Router router({rules::path(), rules::method(), rules::content_type()},
 *               {{{PathPattern{"/create"}, "POST", "json"}, create},
 *                {{PathPattern{"/list"}, "GET", none}, list}});
 * Response res = router(ctx);
 * @endcode
 *
 * The router is immutable once built and may serve concurrent requests.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <memory>  // For std::shared_ptr
#include <vector>  // For std::vector

#include "../request.h"
#include "../response.h"
#include "./context.h"
#include "./path_arguments.h"
#include "./route_table.h"
#include "./rule.h"

namespace qb::gate {
    /**
     * @brief Result of a successful match.
     */
    struct RouteMatch {
        const Route *route = nullptr; ///< The winning route, owned by the router's table.
        PathArguments arguments; ///< Values captured while matching the winner.
    };

    /**
     * @brief Rule-chain router.
     */
    class Router {
    public:
        using RuleList = std::vector<std::shared_ptr<const IRule> >;

    private:
        RuleList _rules;
        RouteTable _table;

    public:
        /**
         * @brief Builds a router.
         * @param rules The dimensions, in evaluation order.
         * @param table The routes; each key holds one value per rule.
         * @throws std::invalid_argument if a rule is null, a route key has the wrong number of
         *         values, or a rule does not accept the value a route declares for it.
         */
        Router(RuleList rules, RouteTable table);

        /**
         * @brief Finds the route serving `request`.
         * @return The winning route and its captured path arguments.
         * @throws HttpError built by the first rule that rejects every remaining candidate.
         */
        [[nodiscard]] RouteMatch match(const Request &request) const;

        /**
         * @brief Routes the context's request, publishes the captured path arguments into
         *        the context and calls the winning route's handler.
         * @throws HttpError when no route matches, or whatever the handler throws.
         */
        Response handle(Context &ctx) const;

        /** @brief Same as `handle()`, so that a router can be used as a `Handler`. */
        Response operator()(Context &ctx) const { return handle(ctx); }

        [[nodiscard]] const RuleList &rules() const noexcept { return _rules; }
        [[nodiscard]] const RouteTable &table() const noexcept { return _table; }
    };
} // namespace qb::gate
