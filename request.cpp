/**
 * @file qbm/gate/request.cpp
 * @brief Implementation of the request descriptor and the in-memory body source.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Gate
 */
#include "./request.h"

#include <algorithm>

namespace qb::gate {

std::string StringBodySource::read(std::size_t max_bytes) {
    const std::size_t available = _data.size() - _offset;
    const std::size_t n = std::min(available, max_bytes);
    std::string out = _data.substr(_offset, n);
    _offset += n;
    return out;
}

Request::Request(std::string method,
                 const std::string &target,
                 std::optional<std::string> content_type,
                 std::size_t content_length,
                 std::shared_ptr<IBodySource> body_source)
    : _method(std::move(method))
    , _uri(target)
    , _path(qb::io::uri::decode(_uri.path()))
    , _content_type(std::move(content_type))
    , _content_length(content_length)
    , _body_source(std::move(body_source)) {
    if (_content_type)
        _headers["Content-Type"] = *_content_type;
    if (_content_length)
        _headers["Content-Length"] = std::to_string(_content_length);
}

Request Request::with_body(std::string method,
                           const std::string &target,
                           std::string content_type,
                           std::string body) {
    const std::size_t length = body.size();
    return Request(std::move(method), target, std::move(content_type), length,
                   std::make_shared<StringBodySource>(std::move(body)));
}

std::optional<std::string> Request::header(const std::string &name) const {
    auto it = _headers.find(name);
    if (it != _headers.end())
        return it->second;
    return std::nullopt;
}

Request &Request::set_header(const std::string &name, std::string value) {
    _headers[name] = std::move(value);
    return *this;
}

const std::string &Request::read_body() {
    if (!_body_cache) {
        if (_body_source && _content_length)
            _body_cache = _body_source->read(_content_length);
        else
            _body_cache.emplace();
    }
    return *_body_cache;
}

} // namespace qb::gate
