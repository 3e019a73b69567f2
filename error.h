/**
 * @file qbm/gate/error.h
 * @brief Defines `HttpError`, the exception carried from the gate layers to the error sink.
 *
 * Every condition raised by the router, the body parser or the authentication wrapper
 * is an `HttpError` carrying a status code, an optional human-readable message and
 * optional extra response headers. Turning it into a wire response is the job of
 * `ErrorHandler` (see middleware/error_handling.h) or of the embedding server.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "./types.h"

namespace qb::gate {
    /** @brief Ordered list of extra response headers attached to an error. */
    using HeaderList = std::vector<std::pair<std::string, std::string> >;

    /**
     * @brief Exception describing an HTTP-level failure.
     *
     * `what()` returns "<code> <reason>" followed by the message when one is set.
     */
    class HttpError : public std::runtime_error {
    private:
        Status _status;
        std::optional<std::string> _message;
        HeaderList _headers;

        static std::string make_what(Status status, const std::optional<std::string> &message);

    public:
        /**
         * @brief Constructs an `HttpError`.
         * @param status The HTTP status to report.
         * @param message Optional human-readable message.
         * @param headers Extra headers to add to the rendered response.
         */
        explicit HttpError(Status status,
                           std::optional<std::string> message = std::nullopt,
                           HeaderList headers = {});

        [[nodiscard]] Status status() const noexcept { return _status; }
        [[nodiscard]] const std::optional<std::string> &message() const noexcept { return _message; }
        [[nodiscard]] const HeaderList &headers() const noexcept { return _headers; }

        /**
         * @brief Looks up an attached header, case-insensitively.
         * @return The first matching value, or `std::nullopt`.
         */
        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    };

    /** @brief Named constructors for the conditions raised by the gate layers. */
    namespace error {
        /// 404, no path pattern matched.
        [[nodiscard]] HttpError route_not_found();
        /// 405, method mismatch. `allow` lists the methods that would have matched, if known.
        [[nodiscard]] HttpError method_not_allowed(const std::vector<std::string> &allow = {});
        /// 415, content-type mismatch.
        [[nodiscard]] HttpError unsupported_media_type(std::string message = "Unsupported Content-Type");
        /// 400, a body was required but the request declared no content.
        [[nodiscard]] HttpError body_required();
        /// 422, the body could not be parsed.
        [[nodiscard]] HttpError malformed_body(std::string message = "Invalid JSON");
        /// 413, declared body length over the configured limit.
        [[nodiscard]] HttpError payload_too_large(std::size_t limit);
        /// 400, the parsed body does not have the expected shape.
        [[nodiscard]] HttpError shape_validation_failed(std::string reason);
        /// 401, authentication missing or refused.
        [[nodiscard]] HttpError unauthorized(std::string message, HeaderList headers = {});
    } // namespace error
} // namespace qb::gate
