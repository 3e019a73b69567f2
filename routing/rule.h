/**
 * @file qbm/gate/routing/rule.h
 * @brief Defines `IRule`, one matching dimension of the router, and its built-in variants.
 *
 * A rule decides whether a request matches the value a route declares for that rule's
 * dimension (its "expected value"), and names the error raised when no route of the table
 * survives the dimension. Rules hold no per-request state: the path rule writes the values
 * it captures into a `PathArguments` owned by the caller.
 *
 * Built-in dimensions:
 * - `PathRule`: the expected value is a `PathPattern`; failure is 404.
 * - `MethodRule`: the expected value is a method string, compared case-sensitively; failure is 405.
 * - `ContentTypeRule`: the expected value is `none`, a full media type (`"application/json"`)
 *   or a bare token (`"json"`) matched against the `+`-separated parts of the subtype;
 *   failure is 415.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <memory>       // For std::shared_ptr
#include <string>       // For std::string
#include <string_view>  // For std::string_view
#include <variant>      // For std::variant, std::monostate
#include <vector>       // For std::vector

#include "../error.h"
#include "../request.h"
#include "./path_arguments.h"
#include "./path_pattern.h"

namespace qb::gate {
    /**
     * @brief Value a route declares for one dimension.
     * `std::monostate` stands for "none" (e.g. no content expected).
     */
    using RuleValue = std::variant<std::monostate, std::string, PathPattern>;

    /** @brief The "none" rule value. */
    inline constexpr std::monostate none{};

    /** @brief Printable form of a rule value, for logs and error messages. */
    [[nodiscard]] std::string to_string(const RuleValue &value);

    /** @brief Identifies the built-in dimensions, for introspection. */
    enum class RuleKind {
        PATH,
        METHOD,
        CONTENT_TYPE,
        CUSTOM
    };

    /**
     * @brief Interface of a routing dimension.
     */
    class IRule {
    public:
        virtual ~IRule() = default;

        /**
         * @brief Checks a request against the value a route declares for this dimension.
         * @param request The request being routed.
         * @param expected The route's value for this dimension.
         * @param captures Request-scoped output for values captured during the check.
         *                 Only written on success, and only by rules that capture.
         * @return `true` if the request matches.
         */
        virtual bool check(const Request &request, const RuleValue &expected, PathArguments &captures) const = 0;

        /**
         * @brief Builds the error raised when no route survives this dimension.
         * @param request The request being routed.
         * @param rejected The values of the routes this dimension just rejected, in registration order.
         */
        [[nodiscard]] virtual HttpError error_for(const Request &request,
                                                  const std::vector<const RuleValue *> &rejected) const = 0;

        /**
         * @brief Tells whether a route may declare `value` for this dimension.
         * Used by the router to reject misconfigured tables at construction time.
         */
        [[nodiscard]] virtual bool accepts(const RuleValue &value) const = 0;

        [[nodiscard]] virtual RuleKind kind() const noexcept { return RuleKind::CUSTOM; }

        /** @brief Name of the rule, for logging. */
        [[nodiscard]] virtual std::string name() const = 0;
    };

    /** @brief Matches the request path against a `PathPattern`. */
    class PathRule : public IRule {
    public:
        bool check(const Request &request, const RuleValue &expected, PathArguments &captures) const override;
        [[nodiscard]] HttpError error_for(const Request &request,
                                          const std::vector<const RuleValue *> &rejected) const override;
        [[nodiscard]] bool accepts(const RuleValue &value) const override;
        [[nodiscard]] RuleKind kind() const noexcept override { return RuleKind::PATH; }
        [[nodiscard]] std::string name() const override { return "path"; }
    };

    /** @brief Exact, case-sensitive comparison of the request method. */
    class MethodRule : public IRule {
    public:
        bool check(const Request &request, const RuleValue &expected, PathArguments &captures) const override;
        /** The error carries an `Allow` header listing the rejected routes' methods. */
        [[nodiscard]] HttpError error_for(const Request &request,
                                          const std::vector<const RuleValue *> &rejected) const override;
        [[nodiscard]] bool accepts(const RuleValue &value) const override;
        [[nodiscard]] RuleKind kind() const noexcept override { return RuleKind::METHOD; }
        [[nodiscard]] std::string name() const override { return "method"; }
    };

    /** @brief Media-type comparison with support for bare subtype tokens. */
    class ContentTypeRule : public IRule {
    public:
        bool check(const Request &request, const RuleValue &expected, PathArguments &captures) const override;
        [[nodiscard]] HttpError error_for(const Request &request,
                                          const std::vector<const RuleValue *> &rejected) const override;
        [[nodiscard]] bool accepts(const RuleValue &value) const override;
        [[nodiscard]] RuleKind kind() const noexcept override { return RuleKind::CONTENT_TYPE; }
        [[nodiscard]] std::string name() const override { return "content-type"; }

        /**
         * @brief The media-type matching used by this rule, usable on its own.
         * @param expected A full media type (contains `/`) or a bare subtype token.
         * @param content_type The request's content type.
         * @return `true` on an exact match, or when the token is one of the `+`-separated
         *         parts of the subtype of `content_type`.
         */
        [[nodiscard]] static bool media_type_matches(std::string_view expected, std::string_view content_type);
    };

    /** @brief Shared, stateless instances of the built-in rules. */
    namespace rules {
        [[nodiscard]] const std::shared_ptr<const IRule> &path();
        [[nodiscard]] const std::shared_ptr<const IRule> &method();
        [[nodiscard]] const std::shared_ptr<const IRule> &content_type();
    } // namespace rules
} // namespace qb::gate
