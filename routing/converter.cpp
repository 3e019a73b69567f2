/**
 * @file qbm/gate/routing/converter.cpp
 * @brief Implementation of `Converter` and the built-in converters.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./converter.h"

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace qb::gate {

Converter::Converter(std::string name, ParseFn parse)
    : _name(std::move(name))
    , _parse(std::make_shared<const ParseFn>(std::move(parse))) {
    if (!*_parse) {
        throw std::invalid_argument("Converter '" + _name + "': parse function cannot be empty.");
    }
}

namespace {

std::optional<qb::json> parse_integer(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        // "+-5" must not be accepted through the '-' branch of from_chars
        if (!text.empty() && text.front() == '-')
            return std::nullopt;
    }
    if (text.empty())
        return std::nullopt;

    long long value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
        return std::nullopt;
    return qb::json(value);
}

std::optional<qb::json> parse_number(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-')
            return std::nullopt;
    }
    if (text.empty())
        return std::nullopt;

    // general format: decimal or exponent notation only, no hex, locale-independent
    double value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if (ec != std::errc() || ptr != last || !std::isfinite(value))
        return std::nullopt;
    return qb::json(value);
}

std::optional<qb::json> parse_string(std::string_view text) {
    return qb::json(std::string(text));
}

} // namespace

namespace converters {

const Converter &integer() {
    static const Converter instance("int", &parse_integer);
    return instance;
}

const Converter &number() {
    static const Converter instance("float", &parse_number);
    return instance;
}

const Converter &string() {
    static const Converter instance("str", &parse_string);
    return instance;
}

} // namespace converters
} // namespace qb::gate
