/**
 * @file qbm/gate/middleware/error_handler.cpp
 * @brief Implementation of `ErrorHandler`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#include "./error_handler.h"

#include <exception>
#include <stdexcept>

#include <qb/json.h>

#include "../logger.h"

namespace qb::gate {

namespace {
    std::string escape_html(const std::string &text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                default: out += c; break;
            }
        }
        return out;
    }
} // namespace

ErrorHandler::ErrorHandler(Handler next, Options options)
    : _next(std::move(next)), _options(std::move(options)) {
    if (!_next) {
        throw std::invalid_argument("ErrorHandler: next handler is empty.");
    }
}

ErrorHandler::ErrorHandler(Handler next)
    : ErrorHandler(std::move(next), Options()) {}

Response ErrorHandler::handle(Context &ctx) const {
    try {
        return _next(ctx);
    } catch (const HttpError &e) {
        LOG_GATE_DEBUG_REQ(ctx.request(), "rendering " << e.what());
        return render(e);
    } catch (const std::exception &e) {
        LOG_GATE_ERROR_REQ(ctx.request(), "unhandled exception: " << e.what());
        return render(HttpError(Status::INTERNAL_SERVER_ERROR, _options.internal_error_message()));
    }
}

Response ErrorHandler::render(const HttpError &error) const {
    Response res(error.status());

    if (_options.format() == Format::Json) {
        qb::json body = {
            {"code", error.status().code()},
            {"error", std::string(error.status().reason())}
        };
        if (error.message()) {
            body["message"] = *error.message();
        }
        res.json(body, _options.friendly());
    } else {
        const std::string status_line = error.status().str();
        std::string page = "<html><head><title>" + status_line + "</title></head><body><h1>" + status_line + "</h1>";
        if (error.message() && !error.message()->empty()) {
            page += "<p>" + escape_html(*error.message()) + "</p>";
        }
        page += "</body></html>";
        res.text(std::move(page), "text/html");
    }

    for (const auto &[name, value] : error.headers()) {
        res.headers[name] = value;
    }
    return res;
}

} // namespace qb::gate
