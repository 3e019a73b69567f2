/**
 * @file qbm/gate/middleware/basic_auth.h
 * @brief Handler wrapper enforcing HTTP Basic authentication.
 *
 * `BasicAuth` reads the `Authorization: Basic <base64(user:password)>` header, checks the
 * credentials with a user-provided function and, on success, stores the user name in the
 * `Context` under `BasicAuth::USER_KEY` before calling the wrapped handler.
 *
 * Failures are raised as `HttpError`:
 * - missing header or another scheme: 401 "Authentication required", with a
 *   `WWW-Authenticate: Basic realm="<realm>"` header;
 * - undecodable credentials or no `:` separator: 400 "Authentication not processable";
 * - credentials refused by the checker: 401 "Wrong user or password".
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <functional> // For std::function
#include <optional>   // For std::optional
#include <string>     // For std::string
#include <utility>    // For std::pair, std::move

#include "../response.h"
#include "../routing/context.h"
#include "../routing/types.h"

namespace qb::gate {
    /**
     * @brief HTTP Basic authentication in front of a handler.
     */
    class BasicAuth {
    public:
        /** @brief Decides whether a user name and password are valid. */
        using CredentialChecker = std::function<bool(const std::string &user, const std::string &password)>;

        /** @brief Context key of the authenticated user name (`std::string`). */
        static constexpr const char *USER_KEY = "user";

        /**
         * @brief Configuration of a `BasicAuth`.
         */
        class Options {
        private:
            std::string _realm = "Access to content";

        public:
            Options() = default;

            /**
             * @brief Realm announced in the `WWW-Authenticate` challenge.
             * @throws std::invalid_argument if `realm` contains a double quote.
             */
            Options &realm(std::string realm);

            [[nodiscard]] const std::string &realm() const noexcept { return _realm; }
        };

    private:
        Handler _next;
        CredentialChecker _checker;
        Options _options;

    public:
        /** @throws std::invalid_argument if `next` or `checker` is empty. */
        BasicAuth(Handler next, CredentialChecker checker, Options options);
        BasicAuth(Handler next, CredentialChecker checker);

        Response handle(Context &ctx) const;
        Response operator()(Context &ctx) const { return handle(ctx); }

        /**
         * @brief Extracts the credentials of a `Basic` authorization header value.
         * @return `{user, password}`, or `std::nullopt` when the value cannot be decoded
         *         or has no `:` separator.
         */
        [[nodiscard]] static std::optional<std::pair<std::string, std::string> >
        parse_credentials(const std::string &encoded);

        [[nodiscard]] const Options &options() const noexcept { return _options; }
    };
} // namespace qb::gate
