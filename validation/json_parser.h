/**
 * @file qbm/gate/validation/json_parser.h
 * @brief Handler wrapper that reads, parses and validates a JSON request body.
 *
 * `JsonParser` sits in front of a handler. It requires a JSON content type, reads the
 * body once (bounded by the declared length and a configurable maximum), parses it with
 * `qb::json`, optionally checks it against a filter tree, stores the result in the
 * `Context` and calls the wrapped handler.
 *
 * @code
 * auto create = JsonParser(
 *     [](Context &ctx) {
 *         const qb::json &body = *ctx.get_ptr<qb::json>(JsonParser::JSON_BODY_KEY);
 *         return Response(Status::CREATED).json(body);
 *     },
 *     filter::object({filter::required("id", filter::integer(0))}));
 * @endcode
 *
 * Failures are raised as `HttpError`:
 * - no content type: 400 "Body required";
 * - content type without the JSON token: 415 "Only json content is allowed.";
 * - declared length over the maximum: 413;
 * - unparsable body: 422 "Invalid JSON";
 * - rejected by the filter: 400 with the filter's reason.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <qb/json.h>

#include "../response.h"
#include "../routing/context.h"
#include "../routing/types.h"
#include "./filter.h"

namespace qb::gate::validation {

/**
 * @brief Checks a parsed value against a filter.
 * @param filter The filter; a null filter accepts everything.
 * @throws HttpError 400 carrying the filter's reason when the value is rejected.
 */
void validate(const FilterPtr& filter, const qb::json& value);

/**
 * @brief Parses a JSON document and checks it against a filter.
 * @throws HttpError 422 on a parse failure, 400 when the filter rejects the value.
 */
qb::json parse_and_validate(std::string_view bytes, const FilterPtr& filter = nullptr);

class JsonParser {
public:
    /** @brief Context key of the raw body (`std::string`). */
    static constexpr const char* RAW_BODY_KEY = "raw_body";
    /** @brief Context key of the parsed body (`qb::json`). */
    static constexpr const char* JSON_BODY_KEY = "json_body";

    /**
     * @brief Configuration of a `JsonParser`.
     */
    class Options {
    private:
        std::size_t _max_body_size = 1024 * 1024;
        std::string _media_type_token = "json";
    public:
        Options() = default;

        /** @brief Largest accepted declared body length, in bytes. 0 disables the limit. */
        Options& max_body_size(std::size_t bytes) {
            _max_body_size = bytes;
            return *this;
        }

        /**
         * @brief Token required among the `+`-separated parts of the content subtype.
         * @throws std::invalid_argument if `token` is empty or contains `/`.
         */
        Options& media_type_token(std::string token);

        std::size_t max_body_size() const noexcept { return _max_body_size; }
        const std::string& media_type_token() const noexcept { return _media_type_token; }
    };

private:
    Handler _next;
    FilterPtr _filter;
    Options _options;

public:
    /**
     * @param next Handler called once the body is parsed and accepted.
     * @param filter Optional filter the parsed body must pass.
     * @param options Parser configuration.
     * @throws std::invalid_argument if `next` is empty.
     */
    JsonParser(Handler next, FilterPtr filter, Options options);
    explicit JsonParser(Handler next, FilterPtr filter = nullptr);

    Response handle(Context& ctx) const;
    Response operator()(Context& ctx) const { return handle(ctx); }

    const FilterPtr& filter() const noexcept { return _filter; }
    const Options& options() const noexcept { return _options; }
};

} // namespace qb::gate::validation
