/**
 * @file qbm/gate/response.cpp
 * @brief Implementation of the `Response` helpers.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#include "./response.h"

namespace qb::gate {

std::optional<std::string> Response::header(const std::string &name) const {
    auto it = headers.find(name);
    if (it != headers.end())
        return it->second;
    return std::nullopt;
}

Response &Response::json(const qb::json &value, bool friendly) {
    headers["Content-Type"] = "application/json";
    body = friendly ? value.dump(4) : value.dump();
    return *this;
}

Response &Response::text(std::string value, std::string content_type) {
    headers["Content-Type"] = std::move(content_type);
    body = std::move(value);
    return *this;
}

} // namespace qb::gate
