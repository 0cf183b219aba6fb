#ifndef SHIORI_SERVER_APP_HPP
#define SHIORI_SERVER_APP_HPP

#include <crow.h>

#include "middleware/request.hpp"

namespace shiori::server {

/**
 * @brief Central HTTP application type with middleware stack
 *
 * Middleware execution order (before_handle):
 *   1. CORS - Adds headers in after_handle only
 *   2. RequestLogger - Log request timing
 *
 * Note: after_handle runs in reverse order
 */
using ServerApp = crow::App<middleware::CORS, middleware::RequestLogger>;

}  // namespace shiori::server

#endif  // SHIORI_SERVER_APP_HPP
