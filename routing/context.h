/**
 * @file qbm/gate/routing/context.h
 * @brief Defines the Context class, the per-request state shared along a handler chain.
 *
 * A `Context` is created by the embedding server for each request and passed by reference
 * through the router and the wrappers down to the route handler. It owns the `Request`,
 * the `PathArguments` published by the router after a successful match, and a string-keyed
 * store of arbitrary values (parsed body, authenticated user, ...). Nothing in it outlives
 * the request, and it is never shared between requests.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <any>          // For std::any, std::any_cast
#include <optional>     // For std::optional
#include <string>       // For std::string
#include <utility>      // For std::move

#include <qb/system/container/unordered_map.h> // For qb::unordered_map

#include "../request.h"
#include "./path_arguments.h"

namespace qb::gate {
    /**
     * @brief Request-scoped state for one request's journey through the handler chain.
     */
    class Context {
    public:
        /**
         * @brief Type alias for the map used to store custom data within the context.
         * Keys are strings, values are `std::any` to allow storing arbitrary types.
         */
        using CustomDataMap = qb::unordered_map<std::string, std::any>;

    private:
        Request _request; ///< The request being served.
        PathArguments _path_arguments; ///< Values captured by the matched path pattern.
        CustomDataMap _custom_data; ///< Arbitrary request-scoped data.

    public:
        explicit Context(Request request) noexcept
            : _request(std::move(request)) {}

        Context(const Context &) = delete;
        Context &operator=(const Context &) = delete;

        [[nodiscard]] Request &request() noexcept { return _request; }
        [[nodiscard]] const Request &request() const noexcept { return _request; }

        /** @brief Values captured by the path pattern of the matched route. */
        [[nodiscard]] const PathArguments &path_arguments() const noexcept { return _path_arguments; }

        /** @brief Publishes the captured values. Called by the `Router` before dispatching. */
        void set_path_arguments(PathArguments args) noexcept {
            _path_arguments = std::move(args);
        }

        // --- Custom Data Management ---

        /**
         * @brief Stores a custom key-value pair in the context.
         * If the key already exists, its value is overwritten.
         */
        template<typename T>
        void set(const std::string &key, T value) {
            _custom_data[key] = std::move(value);
        }

        /**
         * @brief Retrieves a copy of a custom value, cast to `T`.
         * @return The value, or `std::nullopt` if the key is absent or holds another type.
         */
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const {
            if (const T *ptr = get_ptr<T>(key)) {
                return *ptr;
            }
            return std::nullopt;
        }

        /**
         * @brief Retrieves a pointer to a custom value, cast to `T`.
         * @return The pointer, or `nullptr` if the key is absent or holds another type.
         */
        template<typename T>
        [[nodiscard]] T *get_ptr(const std::string &key) noexcept {
            auto it = _custom_data.find(key);
            if (it != _custom_data.end()) {
                return std::any_cast<T>(&(it->second));
            }
            return nullptr;
        }

        /** @copydoc get_ptr(const std::string &) */
        template<typename T>
        [[nodiscard]] const T *get_ptr(const std::string &key) const noexcept {
            auto it = _custom_data.find(key);
            if (it != _custom_data.end()) {
                return std::any_cast<const T>(&(it->second));
            }
            return nullptr;
        }

        [[nodiscard]] bool has(const std::string &key) const {
            return _custom_data.find(key) != _custom_data.end();
        }

        bool remove(const std::string &key) {
            return _custom_data.erase(key) > 0;
        }
    };
} // namespace qb::gate
