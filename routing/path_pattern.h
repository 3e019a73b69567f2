/**
 * @file qbm/gate/routing/path_pattern.h
 * @brief Defines `PathPattern`, a path template made of literal text and typed converters.
 *
 * A pattern alternates literal segments and converters, always starting with a literal
 * (possibly empty):
 *
 * @code
 * PathPattern p{"/id/", converters::integer(), "/name/", converters::string()};
 * auto args = p.match("/id/42/name/joe"); // -> [42, "joe"]
 * @endcode
 *
 * Matching walks the pattern left to right. A literal must be an exact prefix of the
 * remaining path. A converter receives the remaining path up to the first occurrence of
 * the next literal (or the whole remainder when it is the last element). Nothing may be
 * left over at the end.
 *
 * Because the boundary is the first occurrence of the next literal, a value that itself
 * contains that literal's text is split at the wrong place (e.g. `"/", string, "/foo"`
 * against `/a/foo/foo`): such a path does not match.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <initializer_list> // For std::initializer_list
#include <optional>         // For std::optional
#include <string>           // For std::string
#include <string_view>      // For std::string_view
#include <variant>          // For std::variant
#include <vector>           // For std::vector

#include "./converter.h"
#include "./path_arguments.h"

namespace qb::gate {
    /**
     * @brief Immutable path template with typed captures.
     */
    class PathPattern {
    public:
        /**
         * @brief One element of a pattern: literal text or a converter.
         * Implicitly constructible from both, so patterns can be written as brace lists.
         */
        class Segment {
        private:
            std::variant<std::string, Converter> _value;

        public:
            Segment(const char *literal) : _value(std::string(literal)) {}
            Segment(std::string literal) : _value(std::move(literal)) {}
            Segment(std::string_view literal) : _value(std::string(literal)) {}
            Segment(Converter converter) : _value(std::move(converter)) {}

            [[nodiscard]] bool is_literal() const noexcept {
                return std::holds_alternative<std::string>(_value);
            }

            [[nodiscard]] const std::string &literal() const { return std::get<std::string>(_value); }
            [[nodiscard]] const Converter &converter() const { return std::get<Converter>(_value); }

            bool operator==(const Segment &other) const { return _value == other._value; }
        };

    private:
        /// Normalized elements: strictly alternating, starting with a literal.
        std::vector<Segment> _segments;
        std::size_t _converter_count = 0;

        void normalize(std::vector<Segment> segments);

    public:
        /** @brief Pattern matching only the empty path. */
        PathPattern();

        /**
         * @brief Builds a pattern from an ordered list of literals and converters.
         *
         * Adjacent literals are concatenated. An empty pattern matches only the empty path.
         * @throws std::invalid_argument if the first element is a converter, if two converters
         *         are adjacent, or if an empty literal follows a converter (which would make the
         *         converter boundary ambiguous).
         */
        PathPattern(std::initializer_list<Segment> segments);

        /** @copydoc PathPattern(std::initializer_list<Segment>) */
        explicit PathPattern(std::vector<Segment> segments);

        /**
         * @brief Matches a path against this pattern.
         * @param path The request path.
         * @return The captured values on success, `std::nullopt` otherwise.
         */
        [[nodiscard]] std::optional<PathArguments> match(std::string_view path) const;

        /**
         * @brief Matches a path, writing captures to a caller-provided object.
         * @param path The request path.
         * @param out Receives the captured values. Left untouched when the match fails.
         * @return `true` if the path matches.
         */
        bool match(std::string_view path, PathArguments &out) const;

        /** @brief Normalized elements of the pattern. */
        [[nodiscard]] const std::vector<Segment> &segments() const noexcept { return _segments; }

        /** @brief Number of converters, i.e. the number of values a successful match captures. */
        [[nodiscard]] std::size_t converter_count() const noexcept { return _converter_count; }

        /** @brief Printable form, converters shown as `<name>` (e.g., "/id/<int>/options"). */
        [[nodiscard]] std::string str() const;

        /**
         * @brief Two patterns are equal when they have the same literals and the same
         * converters (by identity, not by name).
         */
        bool operator==(const PathPattern &other) const { return _segments == other._segments; }
        bool operator!=(const PathPattern &other) const { return !(*this == other); }
    };
} // namespace qb::gate
