/**
 * @file qbm/gate/validation/filter.cpp
 * @brief Implementation of the JSON-shape filters.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./filter.h"

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace qb::gate::validation {

namespace {

std::string type_mismatch(FilterKind expected, const qb::json& value) {
    return "expected " + to_string(expected) + ", found " + value.dump() + " of type " + value.type_name();
}

// Whole bounds print without a fractional part: "0", not "0.000000".
std::string format_bound(double bound) {
    if (std::isfinite(bound) && std::floor(bound) == bound && std::fabs(bound) < 1e18) {
        return std::to_string(static_cast<long long>(bound));
    }
    std::ostringstream oss;
    oss << bound;
    return oss.str();
}

// Three-way comparison of a numeric value with a bound. Integer values are compared
// exactly against whole bounds inside the int64 range.
int compare_to_bound(const qb::json& value, double bound) {
    constexpr double int64_limit = 9223372036854775808.0;
    if (value.is_number_integer() && std::floor(bound) == bound && bound >= -int64_limit && bound < int64_limit) {
        const auto whole = static_cast<std::int64_t>(bound);
        if (value.is_number_unsigned()) {
            const auto number = value.get<std::uint64_t>();
            if (whole < 0) {
                return 1;
            }
            const auto limit = static_cast<std::uint64_t>(whole);
            return number < limit ? -1 : (number > limit ? 1 : 0);
        }
        const auto number = value.get<std::int64_t>();
        return number < whole ? -1 : (number > whole ? 1 : 0);
    }
    const double number = value.get<double>();
    return number < bound ? -1 : (number > bound ? 1 : 0);
}

} // namespace

std::string to_string(FilterKind kind) {
    switch (kind) {
        case FilterKind::NUMBER: return "number";
        case FilterKind::INT: return "int";
        case FilterKind::FLOAT: return "float";
        case FilterKind::STRING: return "string";
        case FilterKind::BOOLEAN: return "boolean";
        case FilterKind::NUL: return "null";
        case FilterKind::ARRAY: return "array";
        case FilterKind::OBJECT: return "object";
        case FilterKind::OPTIONS: return "options";
    }
    return "unknown";
}

// --- NumberFilter ---

NumberFilter::NumberFilter(FilterKind kind, std::optional<double> min, std::optional<double> max)
    : _kind(kind), _min(min), _max(max) {
    if (kind != FilterKind::NUMBER && kind != FilterKind::INT && kind != FilterKind::FLOAT) {
        throw std::invalid_argument("NumberFilter: kind '" + to_string(kind) + "' is not numeric.");
    }
    if (_min && _max && *_min > *_max) {
        throw std::invalid_argument("NumberFilter: min " + format_bound(*_min) + " is greater than max " +
                                    format_bound(*_max) + ".");
    }
}

Verdict NumberFilter::evaluate(const qb::json& value) const {
    bool kind_ok = false;
    switch (_kind) {
        case FilterKind::INT: kind_ok = value.is_number_integer(); break;
        case FilterKind::FLOAT: kind_ok = value.is_number_float(); break;
        default: kind_ok = value.is_number(); break;
    }
    if (!kind_ok) {
        return Verdict::reject(type_mismatch(_kind, value));
    }

    if (_min && compare_to_bound(value, *_min) < 0) {
        return Verdict::reject("expected number not less than " + format_bound(*_min) + ", found " + value.dump());
    }
    if (_max && compare_to_bound(value, *_max) > 0) {
        return Verdict::reject("expected number not greater than " + format_bound(*_max) + ", found " + value.dump());
    }
    return Verdict::accept();
}

// --- TypeFilter ---

TypeFilter::TypeFilter(FilterKind kind)
    : _kind(kind) {
    if (kind != FilterKind::STRING && kind != FilterKind::BOOLEAN && kind != FilterKind::NUL) {
        throw std::invalid_argument("TypeFilter: kind '" + to_string(kind) + "' is not a plain type.");
    }
}

Verdict TypeFilter::evaluate(const qb::json& value) const {
    bool ok = false;
    switch (_kind) {
        case FilterKind::STRING: ok = value.is_string(); break;
        case FilterKind::BOOLEAN: ok = value.is_boolean(); break;
        default: ok = value.is_null(); break;
    }
    return ok ? Verdict::accept() : Verdict::reject(type_mismatch(_kind, value));
}

// --- ArrayFilter ---

ArrayFilter::ArrayFilter(FilterPtr items)
    : _items(std::move(items)) {
    if (!_items) {
        throw std::invalid_argument("ArrayFilter: item filter is null.");
    }
}

Verdict ArrayFilter::evaluate(const qb::json& value) const {
    if (!value.is_array()) {
        return Verdict::reject(type_mismatch(FilterKind::ARRAY, value));
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        Verdict child = _items->evaluate(value[i]);
        if (!child) {
            return Verdict::reject(std::to_string(i) + ": " + child.reason);
        }
    }
    return Verdict::accept();
}

// --- ObjectFilter ---

ObjectFilter::ObjectFilter(std::vector<ObjectEntry> entries, ExtraKeys extra_keys)
    : _entries(std::move(entries)), _extra_keys(extra_keys) {
    std::unordered_set<std::string> seen;
    for (const auto& entry : _entries) {
        if (!entry.filter) {
            throw std::invalid_argument("ObjectFilter: filter for key '" + entry.key + "' is null.");
        }
        if (!seen.insert(entry.key).second) {
            throw std::invalid_argument("ObjectFilter: key '" + entry.key + "' is declared twice.");
        }
    }
}

Verdict ObjectFilter::evaluate(const qb::json& value) const {
    if (!value.is_object()) {
        return Verdict::reject(type_mismatch(FilterKind::OBJECT, value));
    }

    for (const auto& entry : _entries) {
        auto it = value.find(entry.key);
        if (it == value.end()) {
            if (entry.required) {
                return Verdict::reject("entry with key '" + entry.key + "' required");
            }
            continue;
        }
        Verdict child = entry.filter->evaluate(*it);
        if (!child) {
            return Verdict::reject(entry.key + ": " + child.reason);
        }
    }

    if (_extra_keys == ExtraKeys::Reject) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            bool declared = false;
            for (const auto& entry : _entries) {
                if (entry.key == it.key()) {
                    declared = true;
                    break;
                }
            }
            if (!declared) {
                return Verdict::reject("unsupported key '" + it.key() + "'");
            }
        }
    }
    return Verdict::accept();
}

// --- OptionsFilter ---

OptionsFilter::OptionsFilter(std::vector<FilterPtr> alternatives)
    : _alternatives(std::move(alternatives)) {
    if (_alternatives.empty()) {
        throw std::invalid_argument("OptionsFilter: no alternative given.");
    }
    for (const auto& alternative : _alternatives) {
        if (!alternative) {
            throw std::invalid_argument("OptionsFilter: alternative is null.");
        }
    }
}

Verdict OptionsFilter::evaluate(const qb::json& value) const {
    std::string reasons;
    for (const auto& alternative : _alternatives) {
        Verdict child = alternative->evaluate(value);
        if (child) {
            return Verdict::accept();
        }
        if (!reasons.empty()) {
            reasons += " or ";
        }
        reasons += child.reason;
    }
    return Verdict::reject("Value not allowed (" + reasons + ").");
}

// --- factories ---

namespace filter {

FilterPtr number(std::optional<double> min, std::optional<double> max) {
    return std::make_shared<NumberFilter>(FilterKind::NUMBER, min, max);
}

FilterPtr integer(std::optional<double> min, std::optional<double> max) {
    return std::make_shared<NumberFilter>(FilterKind::INT, min, max);
}

FilterPtr floating(std::optional<double> min, std::optional<double> max) {
    return std::make_shared<NumberFilter>(FilterKind::FLOAT, min, max);
}

FilterPtr string() {
    static const FilterPtr instance = std::make_shared<TypeFilter>(FilterKind::STRING);
    return instance;
}

FilterPtr boolean() {
    static const FilterPtr instance = std::make_shared<TypeFilter>(FilterKind::BOOLEAN);
    return instance;
}

FilterPtr null() {
    static const FilterPtr instance = std::make_shared<TypeFilter>(FilterKind::NUL);
    return instance;
}

FilterPtr array(FilterPtr items) {
    return std::make_shared<ArrayFilter>(std::move(items));
}

FilterPtr object(std::vector<ObjectEntry> entries, ExtraKeys extra_keys) {
    return std::make_shared<ObjectFilter>(std::move(entries), extra_keys);
}

FilterPtr options(std::vector<FilterPtr> alternatives) {
    return std::make_shared<OptionsFilter>(std::move(alternatives));
}

ObjectEntry required(std::string key, FilterPtr filter) {
    return {std::move(key), std::move(filter), true};
}

ObjectEntry optional(std::string key, FilterPtr filter) {
    return {std::move(key), std::move(filter), false};
}

} // namespace filter

} // namespace qb::gate::validation
