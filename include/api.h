#pragma once

#include <chrono>
#include <string>
#include <crow.h>
#include <crow/middlewares/cors.h>
#include "events/event_manager.h"
#include "request_handler.h"

namespace pem {

/**
 * @brief API Logging Middleware for Crow
 *
 * Logs each request with a short request id and its duration.
 */
class ApiLoggingMiddleware {
public:
    struct context {
        std::chrono::steady_clock::time_point start_time;
        std::string method;
        std::string url;
        std::string client_ip;
        size_t request_size = 0;
        std::string request_id;
    };

    void before_handle(crow::request& req, crow::response& res, context& ctx);
    void after_handle(crow::request& req, crow::response& res, context& ctx);

    long slowRequestThresholdMs = 1000;   ///< Requests at or above this are logged as WARN
};

/**
 * @brief REST API for the event manager
 *
 * Thin Crow layer over RequestHandler plus the optional web UI assets.
 */
class Api {
public:
    /**
     * @brief Construct a new Api object
     *
     * @param manager Event manager the routes act on
     * @param port Port to listen on
     * @param threads Number of HTTP worker threads
     * @param staticDir Directory served at / and /static, empty to disable
     */
    Api(EventManager& manager, int port, int threads, std::string staticDir);

    ~Api();

    /**
     * @brief Start the API server; blocks until stop() is called
     */
    void start();

    /**
     * @brief Stop the API server
     */
    void stop();

private:
    crow::App<crow::CORSHandler, ApiLoggingMiddleware> app_; ///< Crow application with CORS support and API logging
    RequestHandler handler_;
    int port_;
    std::string staticDir_;

    void setupCORS();
    void setupRoutes();

    /**
     * @brief Set up the web UI routes
     */
    void setupStaticRoutes();

    /**
     * @brief Serve a file below staticDir_, 404 if it is missing or escapes the directory
     */
    crow::response serveStaticFile(const std::string& relativePath) const;
};

} // namespace pem
