/**
 * @file qbm/gate/routing/converter.h
 * @brief Defines `Converter`, the typed parser behind a generic path segment.
 *
 * A converter turns the text of a generic path segment into a typed value (stored as
 * `qb::json`), or reports that the text is malformed, which makes the whole path match fail.
 * The built-in converters cover integers, floating-point numbers and raw strings; any
 * callable with the `ParseFn` signature can be wrapped as a custom converter.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <functional>   // For std::function
#include <memory>       // For std::shared_ptr
#include <optional>     // For std::optional
#include <string>       // For std::string
#include <string_view>  // For std::string_view

#include <qb/json.h>    // For qb::json

namespace qb::gate {
    /**
     * @brief Named parse capability for one generic path segment.
     *
     * Converters are immutable and may be shared between patterns and threads; the parse
     * function must therefore be free of side effects.
     */
    class Converter {
    public:
        /**
         * @brief Parse function: returns the typed value, or `std::nullopt` on malformed input.
         */
        using ParseFn = std::function<std::optional<qb::json>(std::string_view)>;

    private:
        std::string _name;
        std::shared_ptr<const ParseFn> _parse; ///< Shared by copies; identifies the converter.

    public:
        /**
         * @brief Constructs a converter.
         * @param name Display name, used when printing patterns (e.g., "int").
         * @param parse The parse function.
         * @throws std::invalid_argument if `parse` is empty.
         */
        Converter(std::string name, ParseFn parse);

        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        /**
         * @brief Parses a segment.
         * @param segment The text delimited by the surrounding literals.
         * @return The converted value, or `std::nullopt` if the text is not valid for this converter.
         */
        [[nodiscard]] std::optional<qb::json> operator()(std::string_view segment) const {
            return (*_parse)(segment);
        }

        /**
         * @brief Two converters are equal when one is a copy of the other.
         * Separately constructed converters differ even if they share a name.
         */
        bool operator==(const Converter &other) const noexcept { return _parse == other._parse; }
        bool operator!=(const Converter &other) const noexcept { return !(*this == other); }
    };

    namespace converters {
        /**
         * @brief Signed decimal integer (optional leading `+` or `-`, digits only, 64-bit range).
         */
        [[nodiscard]] const Converter &integer();

        /**
         * @brief Finite decimal floating-point number: optional sign, digits with an optional fraction
         *        and exponent. Hexadecimal forms, `inf` and `nan` are rejected.
         */
        [[nodiscard]] const Converter &number();

        /** @brief The raw segment text, including the empty string. */
        [[nodiscard]] const Converter &string();
    } // namespace converters
} // namespace qb::gate
