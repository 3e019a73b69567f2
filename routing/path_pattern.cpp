/**
 * @file qbm/gate/routing/path_pattern.cpp
 * @brief Implementation of `PathPattern` construction and matching.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./path_pattern.h"

#include <stdexcept>

namespace qb::gate {

PathPattern::PathPattern()
    : _segments{Segment(std::string())} {}

PathPattern::PathPattern(std::initializer_list<Segment> segments) {
    normalize(std::vector<Segment>(segments));
}

PathPattern::PathPattern(std::vector<Segment> segments) {
    normalize(std::move(segments));
}

void PathPattern::normalize(std::vector<Segment> segments) {
    if (segments.empty()) {
        _segments.emplace_back(std::string());
        return;
    }
    if (!segments.front().is_literal()) {
        throw std::invalid_argument("PathPattern must start with a literal segment (use \"\" for none).");
    }

    for (auto &segment : segments) {
        if (segment.is_literal()) {
            if (!_segments.empty() && _segments.back().is_literal()) {
                _segments.back() = Segment(_segments.back().literal() + segment.literal());
                continue;
            }
            if (!_segments.empty() && segment.literal().empty()) {
                throw std::invalid_argument("PathPattern: empty literal after converter '" +
                                            _segments.back().converter().name() + "'.");
            }
            _segments.push_back(std::move(segment));
        } else {
            if (!_segments.back().is_literal()) {
                throw std::invalid_argument("PathPattern: converters '" + _segments.back().converter().name() +
                                            "' and '" + segment.converter().name() +
                                            "' cannot follow each other.");
            }
            _segments.push_back(std::move(segment));
            ++_converter_count;
        }
    }
}

std::optional<PathArguments> PathPattern::match(std::string_view path) const {
    PathArguments args;
    if (match(path, args))
        return args;
    return std::nullopt;
}

bool PathPattern::match(std::string_view path, PathArguments &out) const {
    PathArguments captured;
    std::string_view remaining = path;

    for (std::size_t i = 0; i < _segments.size(); ++i) {
        const Segment &segment = _segments[i];
        if (segment.is_literal()) {
            const std::string &literal = segment.literal();
            if (remaining.substr(0, literal.size()) != literal)
                return false;
            remaining.remove_prefix(literal.size());
            continue;
        }

        std::string_view content;
        if (i + 1 == _segments.size()) {
            content = remaining;
            remaining = {};
        } else {
            // next element is always a non-empty literal: first occurrence is the boundary
            const auto end = remaining.find(_segments[i + 1].literal());
            if (end == std::string_view::npos)
                return false;
            content = remaining.substr(0, end);
            remaining.remove_prefix(end);
        }

        auto value = segment.converter()(content);
        if (!value)
            return false;
        captured.push_back(std::move(*value));
    }

    if (!remaining.empty())
        return false;
    out = std::move(captured);
    return true;
}

std::string PathPattern::str() const {
    std::string out;
    for (const auto &segment : _segments) {
        if (segment.is_literal()) {
            out += segment.literal();
        } else {
            out += '<';
            out += segment.converter().name();
            out += '>';
        }
    }
    return out;
}

} // namespace qb::gate
