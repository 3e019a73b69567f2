/**
 * @file qbm/gate/types.h
 * @brief Core type definitions shared by the gate routing and validation layers.
 *
 * This file defines the `Status` class, a thin wrapper over llhttp's `http_status`
 * enumeration, and the header map type used by requests, responses and errors.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include <llhttp.h>      // For http_status, http_status_name
#include <ostream>       // For std::ostream
#include <string>        // For std::string, std::to_string
#include <string_view>   // For std::string_view
#include <qb/system/container/unordered_map.h> // For qb::icase_unordered_map
#include "./logger.h"

namespace qb::gate {
    /**
     * @brief HTTP status code wrapper around llhttp's `http_status`.
     *
     * Only the codes produced by the gate layers are given named constants, but any
     * integral code can be stored. The reason phrase is resolved through llhttp.
     */
    class Status {
    public:
        enum class Value : int {
            OK = ::HTTP_STATUS_OK, ///< 200 OK
            CREATED = ::HTTP_STATUS_CREATED, ///< 201 Created
            NO_CONTENT = ::HTTP_STATUS_NO_CONTENT, ///< 204 No Content
            BAD_REQUEST = ::HTTP_STATUS_BAD_REQUEST, ///< 400 Bad Request
            UNAUTHORIZED = ::HTTP_STATUS_UNAUTHORIZED, ///< 401 Unauthorized
            FORBIDDEN = ::HTTP_STATUS_FORBIDDEN, ///< 403 Forbidden
            NOT_FOUND = ::HTTP_STATUS_NOT_FOUND, ///< 404 Not Found
            METHOD_NOT_ALLOWED = ::HTTP_STATUS_METHOD_NOT_ALLOWED, ///< 405 Method Not Allowed
            PAYLOAD_TOO_LARGE = ::HTTP_STATUS_PAYLOAD_TOO_LARGE, ///< 413 Payload Too Large
            UNSUPPORTED_MEDIA_TYPE = ::HTTP_STATUS_UNSUPPORTED_MEDIA_TYPE, ///< 415 Unsupported Media Type
            UNPROCESSABLE_ENTITY = ::HTTP_STATUS_UNPROCESSABLE_ENTITY, ///< 422 Unprocessable Entity
            INTERNAL_SERVER_ERROR = ::HTTP_STATUS_INTERNAL_SERVER_ERROR ///< 500 Internal Server Error
        };

        /// Default constructor, initializes to 200 OK.
        constexpr Status() : _value(static_cast<int>(Value::OK)) {
        }

        /// Construct from qb::gate::Status::Value enum.
        constexpr Status(Value v) : _value(static_cast<int>(v)) {
        }

        /// Construct from raw ::http_status (from llhttp).
        constexpr Status(::http_status s) : _value(static_cast<int>(s)) {
        }

        /// Construct from a plain integral code.
        constexpr explicit Status(int code) : _value(code) {
        }

        constexpr bool operator==(Status other) const {
            return _value == other._value;
        }

        constexpr bool operator!=(Status other) const {
            return !(*this == other);
        }

        constexpr bool operator==(Value v) const {
            return _value == static_cast<int>(v);
        }

        constexpr bool operator!=(Value v) const {
            return !(*this == v);
        }

        constexpr bool operator<(Status other) const {
            return _value < other._value;
        }

        /// Numeric code (e.g., 404).
        [[nodiscard]] constexpr int code() const noexcept {
            return _value;
        }

        /**
         * @brief Reason phrase (e.g., "Not Found").
         * @return The llhttp name of the status, or "Unknown" when llhttp has none.
         */
        [[nodiscard]] std::string_view reason() const noexcept {
            const char *name = ::http_status_name(static_cast<::http_status>(_value));
            return name ? std::string_view(name) : std::string_view("Unknown");
        }

        /// Status line fragment, e.g. "404 Not Found".
        [[nodiscard]] std::string str() const {
            std::string out = std::to_string(_value);
            out += ' ';
            out += reason();
            return out;
        }

        friend std::ostream &operator<<(std::ostream &os, const Status &s) {
            return os << s.str();
        }

        static constexpr Value OK = Value::OK;
        static constexpr Value CREATED = Value::CREATED;
        static constexpr Value NO_CONTENT = Value::NO_CONTENT;
        static constexpr Value BAD_REQUEST = Value::BAD_REQUEST;
        static constexpr Value UNAUTHORIZED = Value::UNAUTHORIZED;
        static constexpr Value FORBIDDEN = Value::FORBIDDEN;
        static constexpr Value NOT_FOUND = Value::NOT_FOUND;
        static constexpr Value METHOD_NOT_ALLOWED = Value::METHOD_NOT_ALLOWED;
        static constexpr Value PAYLOAD_TOO_LARGE = Value::PAYLOAD_TOO_LARGE;
        static constexpr Value UNSUPPORTED_MEDIA_TYPE = Value::UNSUPPORTED_MEDIA_TYPE;
        static constexpr Value UNPROCESSABLE_ENTITY = Value::UNPROCESSABLE_ENTITY;
        static constexpr Value INTERNAL_SERVER_ERROR = Value::INTERNAL_SERVER_ERROR;

    private:
        int _value;
    };

    using status = Status;

    /**
     * @brief Case-insensitive header map (name -> value), as used by the qb HTTP module.
     */
    using Headers = qb::icase_unordered_map<std::string>;
} // namespace qb::gate

namespace std {
    /**
     * @brief Converts a `qb::gate::status` to its "<code> <reason>" form.
     */
    [[nodiscard]] inline std::string to_string(qb::gate::status s) {
        return s.str();
    }
} // namespace std
