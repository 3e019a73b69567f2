/**
 * @file qbm/gate/validation/json_parser.cpp
 * @brief Implementation of the JSON body pipeline.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./json_parser.h"

#include <stdexcept>
#include <utility>

#include "../error.h"
#include "../logger.h"
#include "../routing/rule.h"

namespace qb::gate::validation {

void validate(const FilterPtr& filter, const qb::json& value) {
    if (!filter) {
        return;
    }
    Verdict verdict = filter->evaluate(value);
    if (!verdict) {
        throw error::shape_validation_failed(std::move(verdict.reason));
    }
}

qb::json parse_and_validate(std::string_view bytes, const FilterPtr& filter) {
    qb::json value;
    try {
        value = qb::json::parse(bytes.begin(), bytes.end());
    } catch (const qb::json::parse_error& e) {
        LOG_GATE_DEBUG("JSON body rejected: " << e.what());
        throw error::malformed_body();
    }
    validate(filter, value);
    return value;
}

JsonParser::Options& JsonParser::Options::media_type_token(std::string token) {
    if (token.empty() || token.find('/') != std::string::npos) {
        throw std::invalid_argument("JsonParser::Options: media type token '" + token + "' is not a subtype token.");
    }
    _media_type_token = std::move(token);
    return *this;
}

JsonParser::JsonParser(Handler next, FilterPtr filter, Options options)
    : _next(std::move(next)), _filter(std::move(filter)), _options(std::move(options)) {
    if (!_next) {
        throw std::invalid_argument("JsonParser: next handler is empty.");
    }
}

JsonParser::JsonParser(Handler next, FilterPtr filter)
    : JsonParser(std::move(next), std::move(filter), Options()) {}

Response JsonParser::handle(Context& ctx) const {
    Request& request = ctx.request();

    const auto& content_type = request.content_type();
    if (!content_type) {
        throw error::body_required();
    }
    if (!ContentTypeRule::media_type_matches(_options.media_type_token(), *content_type)) {
        throw error::unsupported_media_type("Only " + _options.media_type_token() + " content is allowed.");
    }
    if (_options.max_body_size() && request.content_length() > _options.max_body_size()) {
        LOG_GATE_DEBUG_REQ(request, "body of " << request.content_length() << " bytes refused, limit is "
                                    << _options.max_body_size());
        throw error::payload_too_large(_options.max_body_size());
    }

    const std::string& raw = request.read_body();
    qb::json body;
    try {
        body = parse_and_validate(raw, _filter);
    } catch (const HttpError& e) {
        LOG_GATE_DEBUG_REQ(request, "body rejected, " << e.what());
        throw;
    }

    ctx.set(RAW_BODY_KEY, raw);
    ctx.set(JSON_BODY_KEY, std::move(body));
    return _next(ctx);
}

} // namespace qb::gate::validation
