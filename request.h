/**
 * @file qbm/gate/request.h
 * @brief Defines the request descriptor consumed by the gate router and body parsers.
 *
 * A `Request` carries what the routing rules and the body parsers need: the method,
 * the target (parsed with `qb::io::uri`), the optional content type, the declared
 * content length, the headers, and a body source that is read at most once.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#pragma once

#include <cstddef>      // For std::size_t
#include <memory>       // For std::shared_ptr
#include <optional>     // For std::optional
#include <string>       // For std::string
#include <string_view>  // For std::string_view
#include <utility>      // For std::move

#include <qb/io/uri.h>  // For qb::io::uri
#include "./types.h"    // For qb::gate::Headers

namespace qb::gate {
    /**
     * @brief Source of request body bytes.
     *
     * Implementations are provided by the embedding server (socket buffer, file, ...).
     * `Request` calls `read()` at most once per request.
     */
    class IBodySource {
    public:
        virtual ~IBodySource() = default;

        /**
         * @brief Reads up to `max_bytes` bytes.
         * @param max_bytes Upper bound on the number of bytes returned.
         * @return The bytes read; fewer than `max_bytes` if the source ran dry.
         */
        virtual std::string read(std::size_t max_bytes) = 0;
    };

    /** @brief In-memory body source. */
    class StringBodySource : public IBodySource {
    private:
        std::string _data;
        std::size_t _offset = 0;

    public:
        explicit StringBodySource(std::string data) noexcept
            : _data(std::move(data)) {}

        std::string read(std::size_t max_bytes) override;
    };

    /**
     * @brief Descriptor of one inbound request.
     *
     * Built by the embedding server for each request and owned by that request's `Context`.
     * Not thread-safe; it is never shared between requests.
     */
    class Request {
    private:
        std::string _method;
        qb::io::uri _uri;
        std::string _path;
        std::optional<std::string> _content_type;
        std::size_t _content_length = 0;
        Headers _headers;
        std::shared_ptr<IBodySource> _body_source;
        std::optional<std::string> _body_cache;

    public:
        /**
         * @brief Constructs a request descriptor.
         * @param method The HTTP method exactly as received (case is significant).
         * @param target The request target; the path is taken from its parsed URI and percent-decoded.
         * @param content_type The `Content-Type`, or `std::nullopt` when the request declares none.
         * @param content_length The declared body length.
         * @param body_source Where body bytes are read from; may be null for body-less requests.
         */
        Request(std::string method,
                const std::string &target,
                std::optional<std::string> content_type = std::nullopt,
                std::size_t content_length = 0,
                std::shared_ptr<IBodySource> body_source = nullptr);

        /**
         * @brief Convenience constructor for an in-memory body.
         * The content length is the size of `body`.
         */
        static Request with_body(std::string method,
                                 const std::string &target,
                                 std::string content_type,
                                 std::string body);

        [[nodiscard]] const std::string &method() const noexcept { return _method; }
        /** @brief The parsed target; its `path()` is still percent-encoded. */
        [[nodiscard]] const qb::io::uri &uri() const noexcept { return _uri; }
        /** @brief The percent-decoded path, without the query. Patterns match against it. */
        [[nodiscard]] const std::string &path() const noexcept { return _path; }
        [[nodiscard]] const std::optional<std::string> &content_type() const noexcept { return _content_type; }
        [[nodiscard]] std::size_t content_length() const noexcept { return _content_length; }

        [[nodiscard]] Headers &headers() noexcept { return _headers; }
        [[nodiscard]] const Headers &headers() const noexcept { return _headers; }

        /**
         * @brief Returns the value of a header, case-insensitively.
         * @return The header value, or `std::nullopt` if absent.
         */
        [[nodiscard]] std::optional<std::string> header(const std::string &name) const;

        /** @brief Sets (or replaces) a header. Returns `*this` for chaining. */
        Request &set_header(const std::string &name, std::string value);

        /**
         * @brief Reads the body, bounded by the declared content length.
         *
         * The underlying source is read only on the first call; later calls return the
         * cached bytes.
         * @return The body bytes (empty when there is no source or the length is 0).
         */
        const std::string &read_body();

        /** @brief `true` once `read_body()` has consumed the source. */
        [[nodiscard]] bool body_consumed() const noexcept { return _body_cache.has_value(); }
    };
} // namespace qb::gate
