/**
 * @file qbm/gate/routing/rule.cpp
 * @brief Implementation of the built-in routing rules.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./rule.h"

#include <algorithm>

namespace qb::gate {

std::string to_string(const RuleValue &value) {
    if (std::holds_alternative<std::monostate>(value))
        return "none";
    if (const auto *str = std::get_if<std::string>(&value))
        return *str;
    return std::get<PathPattern>(value).str();
}

// --- PathRule ---

bool PathRule::check(const Request &request, const RuleValue &expected, PathArguments &captures) const {
    const auto *pattern = std::get_if<PathPattern>(&expected);
    return pattern && pattern->match(request.path(), captures);
}

HttpError PathRule::error_for(const Request &, const std::vector<const RuleValue *> &) const {
    return error::route_not_found();
}

bool PathRule::accepts(const RuleValue &value) const {
    return std::holds_alternative<PathPattern>(value);
}

// --- MethodRule ---

bool MethodRule::check(const Request &request, const RuleValue &expected, PathArguments &) const {
    const auto *method = std::get_if<std::string>(&expected);
    return method && *method == request.method();
}

HttpError MethodRule::error_for(const Request &, const std::vector<const RuleValue *> &rejected) const {
    std::vector<std::string> allow;
    for (const auto *value : rejected) {
        const auto *method = std::get_if<std::string>(value);
        if (method && std::find(allow.begin(), allow.end(), *method) == allow.end())
            allow.push_back(*method);
    }
    return error::method_not_allowed(allow);
}

bool MethodRule::accepts(const RuleValue &value) const {
    const auto *method = std::get_if<std::string>(&value);
    return method && !method->empty();
}

// --- ContentTypeRule ---

bool ContentTypeRule::media_type_matches(std::string_view expected, std::string_view content_type) {
    if (expected.find('/') != std::string_view::npos)
        return expected == content_type;

    const auto slash = content_type.find('/');
    if (slash == std::string_view::npos)
        return false;

    std::string_view subtype = content_type.substr(slash + 1);
    while (true) {
        const auto plus = subtype.find('+');
        if (subtype.substr(0, plus) == expected)
            return true;
        if (plus == std::string_view::npos)
            return false;
        subtype.remove_prefix(plus + 1);
    }
}

bool ContentTypeRule::check(const Request &request, const RuleValue &expected, PathArguments &) const {
    const auto &content_type = request.content_type();
    if (!content_type)
        return std::holds_alternative<std::monostate>(expected);

    const auto *media_type = std::get_if<std::string>(&expected);
    return media_type && media_type_matches(*media_type, *content_type);
}

HttpError ContentTypeRule::error_for(const Request &, const std::vector<const RuleValue *> &) const {
    return error::unsupported_media_type();
}

bool ContentTypeRule::accepts(const RuleValue &value) const {
    if (std::holds_alternative<std::monostate>(value))
        return true;
    const auto *media_type = std::get_if<std::string>(&value);
    return media_type && !media_type->empty();
}

// --- shared instances ---

namespace rules {

const std::shared_ptr<const IRule> &path() {
    static const std::shared_ptr<const IRule> instance = std::make_shared<PathRule>();
    return instance;
}

const std::shared_ptr<const IRule> &method() {
    static const std::shared_ptr<const IRule> instance = std::make_shared<MethodRule>();
    return instance;
}

const std::shared_ptr<const IRule> &content_type() {
    static const std::shared_ptr<const IRule> instance = std::make_shared<ContentTypeRule>();
    return instance;
}

} // namespace rules
} // namespace qb::gate
