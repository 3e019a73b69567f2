/**
 * @file qbm/gate/response.h
 * @brief Defines the response produced by gate handlers.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include <optional>
#include <string>
#include <utility>

#include <qb/json.h>
#include "./types.h"

namespace qb::gate {
    /**
     * @brief Status, headers and body returned by a `Handler`.
     *
     * Serializing it to the wire is left to the embedding server.
     */
    struct Response {
        Status status = Status::OK;
        Headers headers;
        std::string body;

        Response() = default;

        explicit Response(Status s, std::string b = {})
            : status(s), body(std::move(b)) {}

        /** @brief Returns the value of a header, case-insensitively. */
        [[nodiscard]] std::optional<std::string> header(const std::string &name) const;

        /**
         * @brief Sets the body to the serialized JSON value and the content type to `application/json`.
         * @param value The JSON value.
         * @param friendly Indent the output for humans.
         * @return `*this` for chaining.
         */
        Response &json(const qb::json &value, bool friendly = false);

        /** @brief Sets a plain-text body. */
        Response &text(std::string value, std::string content_type = "text/plain; charset=utf-8");
    };
} // namespace qb::gate
