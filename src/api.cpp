#include "api.h"
#include "logger.h"
#include "utils/id_utils.h"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace pem {

namespace {

// Helper function to get client IP from request
std::string getClientIP(const crow::request& req) {
    auto xff_header = req.get_header_value("X-Forwarded-For");
    if (!xff_header.empty()) {
        return xff_header;
    }

    auto real_ip_header = req.get_header_value("X-Real-IP");
    if (!real_ip_header.empty()) {
        return real_ip_header;
    }

    if (!req.remote_ip_address.empty()) {
        return req.remote_ip_address;
    }
    return "unknown";
}

// Helper function to create properly formatted JSON responses
crow::response createJsonResponse(const nlohmann::json& data, int status_code = 200) {
    crow::response res(status_code, data.dump(2));
    res.set_header("Content-Type", "application/json");
    return res;
}

crow::response createJsonResponse(const JsonReply& reply) {
    return createJsonResponse(reply.body, reply.status);
}

} // namespace

void ApiLoggingMiddleware::before_handle(crow::request& req, crow::response& /*res*/, context& ctx) {
    ctx.start_time = std::chrono::steady_clock::now();
    ctx.method = crow::method_name(req.method);
    ctx.url = req.url;
    ctx.client_ip = getClientIP(req);
    ctx.request_size = req.body.size();
    ctx.request_id = utils::generateUniqueId().substr(0, 8); // Short ID for logs

    std::stringstream logMsg;
    logMsg << "[" << ctx.request_id << "] "
           << ctx.method << " " << ctx.url
           << " from " << ctx.client_ip
           << " (size: " << ctx.request_size << " bytes)";
    LOG_DEBUG("API", logMsg.str());
}

void ApiLoggingMiddleware::after_handle(crow::request& /*req*/, crow::response& res, context& ctx) {
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.start_time).count();

    std::stringstream logMsg;
    logMsg << "[" << ctx.request_id << "] "
           << ctx.method << " " << ctx.url
           << " -> " << res.code << " (" << duration_ms << "ms)"
           << " from " << ctx.client_ip
           << " (req: " << ctx.request_size << " bytes, res: " << res.body.size() << " bytes)";

    if (duration_ms >= slowRequestThresholdMs) {
        LOG_WARN("API", logMsg.str() + " [SLOW]");
    } else if (res.code >= 500) {
        LOG_ERROR("API", logMsg.str());
    } else {
        LOG_INFO("API", logMsg.str());
    }
}

Api::Api(EventManager& manager, int port, int threads, std::string staticDir)
    : handler_(manager), port_(port), staticDir_(std::move(staticDir)) {
    app_.port(static_cast<uint16_t>(port_));
    app_.concurrency(static_cast<uint16_t>(std::max(1, threads)));
    app_.server_name("protect-event-manager");
    app_.loglevel(crow::LogLevel::Warning);

    setupCORS();
    setupRoutes();

    LOG_INFO("API", "HTTP worker threads: " + std::to_string(std::max(1, threads)));
}

Api::~Api() {
}

void Api::setupCORS() {
    auto& cors = app_.get_middleware<crow::CORSHandler>();
    cors.global()
        .headers("*")
        .methods("GET"_method, "POST"_method, "OPTIONS"_method)
        .origin("*");
}

void Api::setupRoutes() {
    LOG_INFO("API", "Setting up all API routes");

    CROW_ROUTE(app_, "/start")
        .methods("POST"_method)
    ([this](const crow::request& req) {
        return createJsonResponse(handler_.start(req.body));
    });

    CROW_ROUTE(app_, "/cancel")
        .methods("POST"_method)
    ([this](const crow::request& req) {
        return createJsonResponse(handler_.cancel(req.body));
    });

    CROW_ROUTE(app_, "/status")
        .methods("GET"_method)
    ([this](const crow::request& req) {
        std::optional<std::string> identifier;
        if (const char* value = req.url_params.get("identifier")) {
            identifier = std::string(value);
        }
        return createJsonResponse(handler_.status(identifier));
    });

    CROW_ROUTE(app_, "/health")
        .methods("GET"_method, "HEAD"_method)
    ([this](const crow::request& req) {
        if (req.method == "HEAD"_method) {
            return crow::response(crow::status::OK);
        }
        return createJsonResponse(handler_.health());
    });

    CROW_ROUTE(app_, "/api/v1/tasks")
        .methods("GET"_method)
    ([this]() {
        return createJsonResponse(handler_.tasks());
    });

    CROW_ROUTE(app_, "/api/v1/tasks/<string>")
        .methods("GET"_method)
    ([this](const std::string& taskId) {
        return createJsonResponse(handler_.task(taskId));
    });

    setupStaticRoutes();

    LOG_INFO("API", "Finished setting up all API routes");
}

void Api::setupStaticRoutes() {
    CROW_ROUTE(app_, "/")
    ([this]() {
        if (staticDir_.empty()) {
            return crow::response("Protect Event Manager");
        }
        return serveStaticFile("index.html");
    });

    CROW_ROUTE(app_, "/static/<path>")
    ([this](const std::string& path) {
        if (staticDir_.empty()) {
            return crow::response(404);
        }
        return serveStaticFile(path);
    });
}

crow::response Api::serveStaticFile(const std::string& relativePath) const {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path root = fs::weakly_canonical(fs::path(staticDir_), ec);
    if (ec) {
        return crow::response(404);
    }
    fs::path target = fs::weakly_canonical(root / relativePath, ec);
    if (ec) {
        return crow::response(404);
    }

    // Reject paths that resolve outside the static directory
    auto rootText = root.string();
    auto targetText = target.string();
    if (targetText.compare(0, rootText.size(), rootText) != 0 ||
        (targetText.size() > rootText.size() && targetText[rootText.size()] != '/')) {
        LOG_WARN("API", "Rejected static path outside web root: " + relativePath);
        return crow::response(404);
    }
    if (!fs::is_regular_file(target, ec)) {
        return crow::response(404);
    }

    crow::response res;
    res.set_static_file_info_unsafe(targetText);
    return res;
}

void Api::start() {
    LOG_INFO("API", "Starting API server on port " + std::to_string(port_));
    app_.run();
}

void Api::stop() {
    LOG_INFO("API", "Stopping API server...");
    app_.stop();
}

} // namespace pem
