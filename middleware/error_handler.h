/**
 * @file qbm/gate/middleware/error_handler.h
 * @brief Handler wrapper that turns exceptions into error responses.
 *
 * `ErrorHandler` calls the wrapped handler and converts what it throws:
 * - an `HttpError` becomes a response with the error's status, a body describing it
 *   and the error's extra headers (`Allow`, `WWW-Authenticate`, ...);
 * - any other `std::exception` is logged and becomes a 500 with a generic message.
 *
 * Two body formats are available:
 * - JSON: `{"code":404,"error":"Not Found","message":"Path not found"}`, the message
 *   being omitted when the error has none;
 * - HTML: a minimal page titled with the status line.
 *
 * @code
 * ErrorHandler app(router, ErrorHandler::Options().format(ErrorHandler::Format::Html));
 * Response res = app(ctx);
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <string>  // For std::string
#include <utility> // For std::move

#include "../error.h"
#include "../response.h"
#include "../routing/context.h"
#include "../routing/types.h"

namespace qb::gate {
    /**
     * @brief Renders exceptions thrown by a handler as HTTP responses.
     */
    class ErrorHandler {
    public:
        /** @brief Body format of the rendered errors. */
        enum class Format {
            Json,
            Html
        };

        /**
         * @brief Configuration of an `ErrorHandler`.
         */
        class Options {
        private:
            Format _format = Format::Json;
            bool _friendly = false;
            std::string _internal_error_message = "A server error occurred. Please contact an administrator.";

        public:
            Options() = default;

            Options &format(Format f) noexcept {
                _format = f;
                return *this;
            }

            /** @brief Indents JSON bodies. */
            Options &friendly(bool enabled) noexcept {
                _friendly = enabled;
                return *this;
            }

            /** @brief Message of the 500 responses built from non-HTTP exceptions. */
            Options &internal_error_message(std::string message) {
                _internal_error_message = std::move(message);
                return *this;
            }

            [[nodiscard]] Format format() const noexcept { return _format; }
            [[nodiscard]] bool friendly() const noexcept { return _friendly; }
            [[nodiscard]] const std::string &internal_error_message() const noexcept { return _internal_error_message; }
        };

    private:
        Handler _next;
        Options _options;

    public:
        /** @throws std::invalid_argument if `next` is empty. */
        ErrorHandler(Handler next, Options options);
        explicit ErrorHandler(Handler next);

        /**
         * @brief Calls the wrapped handler, rendering what it throws.
         */
        Response handle(Context &ctx) const;
        Response operator()(Context &ctx) const { return handle(ctx); }

        /**
         * @brief Builds the response describing `error`, in the configured format.
         */
        [[nodiscard]] Response render(const HttpError &error) const;

        [[nodiscard]] const Options &options() const noexcept { return _options; }
    };
} // namespace qb::gate
