/**
 * @file qbm/gate/routing/path_arguments.h
 * @brief Defines the PathArguments class for storing typed values captured from a request path.
 *
 * This file contains the `PathArguments` class, which holds the values produced by the
 * converters of a `PathPattern` when it matches a request path (e.g., `42` and `"joe"` for
 * the pattern `"/id/", integer, "/name/", string` against `/id/42/name/joe`).
 * Values are kept in pattern order and are owned by the object; a `PathArguments` belongs
 * to exactly one request.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <cstddef>     // For std::size_t
#include <optional>    // For std::optional
#include <stdexcept>   // For std::out_of_range
#include <string>      // For std::string
#include <utility>     // For std::move
#include <vector>      // For std::vector

#include <qb/json.h>   // For qb::json

namespace qb::gate {

/**
 * @brief Ordered collection of the typed values captured while matching a path pattern.
 */
class PathArguments {
public:
    /** @brief The underlying storage type: one JSON value per converter of the pattern. */
    using Storage = std::vector<qb::json>;

private:
    Storage _values; ///< Captured values, in pattern order.

public:
    PathArguments() = default;

    explicit PathArguments(Storage values) noexcept
        : _values(std::move(values)) {}

    PathArguments(const PathArguments&) = default;
    PathArguments(PathArguments&&) noexcept = default;
    PathArguments& operator=(const PathArguments&) = default;
    PathArguments& operator=(PathArguments&&) noexcept = default;

    /** @brief Appends a captured value. */
    void push_back(qb::json value) {
        _values.push_back(std::move(value));
    }

    /**
     * @brief Accesses a captured value with bounds checking.
     * @param index Position of the converter among the pattern's converters.
     * @throws std::out_of_range if `index >= size()`.
     */
    [[nodiscard]] const qb::json& at(std::size_t index) const {
        if (index >= _values.size()) {
            throw std::out_of_range("PathArguments: no captured value at index " + std::to_string(index));
        }
        return _values[index];
    }

    /** @brief Unchecked access. */
    [[nodiscard]] const qb::json& operator[](std::size_t index) const noexcept { return _values[index]; }

    /**
     * @brief Retrieves a captured value converted to `T`.
     * @tparam T Target type (e.g., `long long`, `double`, `std::string`).
     * @param index Position of the converter among the pattern's converters.
     * @return The converted value, or `std::nullopt` if the index is out of range or the
     *         stored value cannot be converted to `T`.
     */
    template<typename T>
    [[nodiscard]] std::optional<T> get(std::size_t index) const {
        if (index >= _values.size()) {
            return std::nullopt;
        }
        try {
            return _values[index].get<T>();
        } catch (const qb::json::exception& /*e*/) {
            return std::nullopt;
        }
    }

    /** @brief Gets a constant reference to the underlying storage. */
    [[nodiscard]] const Storage& values() const noexcept { return _values; }

    /** @brief Removes all captured values. */
    void clear() noexcept { _values.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }
    [[nodiscard]] bool empty() const noexcept { return _values.empty(); }

    [[nodiscard]] auto begin() const noexcept { return _values.begin(); }
    [[nodiscard]] auto end() const noexcept { return _values.end(); }

    bool operator==(const PathArguments& other) const { return _values == other._values; }
    bool operator!=(const PathArguments& other) const { return !(*this == other); }

    void swap(PathArguments& other) noexcept { _values.swap(other._values); }
};

} // namespace qb::gate
