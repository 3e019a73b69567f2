/**
 * @file qbm/gate/middleware/basic_auth.cpp
 * @brief Implementation of `BasicAuth`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#include "./basic_auth.h"

#include <exception>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <qb/io/crypto.h>

#include "../error.h"
#include "../logger.h"

namespace qb::gate {

namespace {
    constexpr std::string_view BASIC_PREFIX = "Basic ";
} // namespace

BasicAuth::Options &BasicAuth::Options::realm(std::string realm) {
    if (realm.find('"') != std::string::npos) {
        throw std::invalid_argument("BasicAuth::Options: realm must not contain '\"'.");
    }
    _realm = std::move(realm);
    return *this;
}

BasicAuth::BasicAuth(Handler next, CredentialChecker checker, Options options)
    : _next(std::move(next)), _checker(std::move(checker)), _options(std::move(options)) {
    if (!_next) {
        throw std::invalid_argument("BasicAuth: next handler is empty.");
    }
    if (!_checker) {
        throw std::invalid_argument("BasicAuth: credential checker is empty.");
    }
}

BasicAuth::BasicAuth(Handler next, CredentialChecker checker)
    : BasicAuth(std::move(next), std::move(checker), Options()) {}

std::optional<std::pair<std::string, std::string> >
BasicAuth::parse_credentials(const std::string &encoded) {
    std::string decoded;
    try {
        auto bytes = qb::crypto::base64_decode(encoded);
        decoded.assign(bytes.begin(), bytes.end());
    } catch (const std::exception &) {
        return std::nullopt;
    }

    // reject input the decoder silently skipped over
    std::vector<unsigned char> raw(decoded.begin(), decoded.end());
    if (qb::crypto::base64_encode(raw.data(), raw.size()) != encoded) {
        return std::nullopt;
    }

    const auto colon = decoded.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(decoded.substr(0, colon), decoded.substr(colon + 1));
}

Response BasicAuth::handle(Context &ctx) const {
    const auto authorization = ctx.request().header("Authorization");
    if (!authorization || authorization->compare(0, BASIC_PREFIX.size(), BASIC_PREFIX) != 0) {
        throw error::unauthorized("Authentication required",
                                  {{"WWW-Authenticate", "Basic realm=\"" + _options.realm() + "\""}});
    }

    auto credentials = parse_credentials(authorization->substr(BASIC_PREFIX.size()));
    if (!credentials) {
        throw HttpError(Status::BAD_REQUEST, std::string("Authentication not processable"));
    }

    auto &[user, password] = *credentials;
    if (!_checker(user, password)) {
        LOG_GATE_INFO_REQ(ctx.request(), "basic authentication failed for user '" << user << "'");
        throw error::unauthorized("Wrong user or password");
    }

    LOG_GATE_DEBUG("Basic authentication succeeded for user '" << user << "'");
    ctx.set(USER_KEY, std::move(user));
    return _next(ctx);
}

} // namespace qb::gate
