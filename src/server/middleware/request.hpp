#ifndef SHIORI_SERVER_MIDDLEWARE_REQUEST_HPP
#define SHIORI_SERVER_MIDDLEWARE_REQUEST_HPP

#include <crow.h>

#include <chrono>

#include "atom/log/spdlog_logger.hpp"

namespace shiori::server::middleware {

/**
 * @brief CORS headers on every response
 */
struct CORS {
    struct context {};

    void before_handle(crow::request& /*req*/, crow::response& /*res*/,
                       context& /*ctx*/) {}

    void after_handle(crow::request& /*req*/, crow::response& res,
                      context& /*ctx*/) {
        res.add_header("Access-Control-Allow-Origin", "*");
        res.add_header("Access-Control-Allow-Methods",
                       "GET, POST, PUT, DELETE, OPTIONS");
        res.add_header("Access-Control-Allow-Headers", "Content-Type");
        res.add_header("Access-Control-Max-Age", "3600");
    }
};

/**
 * @brief Request logging middleware
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
    };

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        LOG_DEBUG("Incoming request: {} {}", req.method_str(), req.url);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        LOG_INFO("Request completed: {} {} - Status: {} - Duration: {}ms",
                 req.method_str(), req.url, res.code, duration.count());
    }
};

}  // namespace shiori::server::middleware

#endif  // SHIORI_SERVER_MIDDLEWARE_REQUEST_HPP
