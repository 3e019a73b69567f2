/**
 * @file qbm/gate/error.cpp
 * @brief Implementation of `HttpError` and its named constructors.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#include "./error.h"

#include <algorithm>
#include <cctype>

namespace qb::gate {

std::string HttpError::make_what(Status status, const std::optional<std::string> &message) {
    std::string out = status.str();
    if (message && !message->empty()) {
        out += ": ";
        out += *message;
    }
    return out;
}

HttpError::HttpError(Status status, std::optional<std::string> message, HeaderList headers)
    : std::runtime_error(make_what(status, message))
    , _status(status)
    , _message(std::move(message))
    , _headers(std::move(headers)) {}

std::optional<std::string> HttpError::header(std::string_view name) const {
    const auto same_char = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    };
    for (const auto &[key, value] : _headers) {
        if (key.size() == name.size() && std::equal(key.begin(), key.end(), name.begin(), same_char))
            return value;
    }
    return std::nullopt;
}

namespace error {

HttpError route_not_found() {
    return HttpError(Status::NOT_FOUND, "Path not found");
}

HttpError method_not_allowed(const std::vector<std::string> &allow) {
    HeaderList headers;
    if (!allow.empty()) {
        std::string value;
        for (const auto &method : allow) {
            if (!value.empty())
                value += ", ";
            value += method;
        }
        headers.emplace_back("Allow", std::move(value));
    }
    return HttpError(Status::METHOD_NOT_ALLOWED, "Method not allowed", std::move(headers));
}

HttpError unsupported_media_type(std::string message) {
    return HttpError(Status::UNSUPPORTED_MEDIA_TYPE, std::move(message));
}

HttpError body_required() {
    return HttpError(Status::BAD_REQUEST, "Body required");
}

HttpError malformed_body(std::string message) {
    return HttpError(Status::UNPROCESSABLE_ENTITY, std::move(message));
}

HttpError payload_too_large(std::size_t limit) {
    return HttpError(Status::PAYLOAD_TOO_LARGE,
                     "Body larger than " + std::to_string(limit) + " bytes");
}

HttpError shape_validation_failed(std::string reason) {
    return HttpError(Status::BAD_REQUEST, std::move(reason));
}

HttpError unauthorized(std::string message, HeaderList headers) {
    return HttpError(Status::UNAUTHORIZED, std::move(message), std::move(headers));
}

} // namespace error
} // namespace qb::gate
