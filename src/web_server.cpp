#include "web_server.hpp"
#include <ctime>
#include <iostream>

namespace engagement {

WebServer::WebServer(ConfigPtr config, std::string models_path, SourceSpec default_source,
                     bool log_enabled)
    : config_(requireConfig(std::move(config), "WebServer")),
      models_path_(std::move(models_path)),
      default_source_(std::move(default_source)),
      log_enabled_(log_enabled),
      initialized_(false) {
    session_ = std::make_unique<MonitorSession>(models_path_);
}

WebServer::~WebServer() {
    if (session_ && session_->isRunning()) {
        session_->stop();
    }
}

bool WebServer::initialize() {
    try {
        CROW_ROUTE(app_, "/").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        CROW_ROUTE(app_, "/health").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        CROW_ROUTE(app_, "/session/start").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleSessionStart(req);
        });

        CROW_ROUTE(app_, "/session/stop").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleSessionStop(req);
        });

        CROW_ROUTE(app_, "/session/status").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleSessionStatus(req);
        });

        CROW_ROUTE(app_, "/metrics").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleMetrics(req);
        });

        initialized_ = true;
        std::cout << "[Server] Routes registered" << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Server] Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::start(int port) {
    if (!initialized_) {
        std::cerr << "[Server] Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "[Server] Starting server on port " << port << std::endl;
    app_.port(port).multithreaded().run();
}

void WebServer::stop() {
    if (session_->isRunning()) {
        session_->stop();
    }
    app_.stop();
}

crow::response WebServer::handleHealthCheck(const crow::request& req) {
    json health_data = {
        {"status", "healthy"},
        {"service", SERVICE_NAME},
        {"version", VERSION},
        {"running", session_->isRunning()},
        {"timestamp", std::time(nullptr)}
    };
    return createResponse(200, createSuccessResponse(health_data));
}

crow::response WebServer::handleSessionStart(const crow::request& req) {
    Timer timer;

    try {
        if (session_->isRunning()) {
            json response_data = {
                {"message", "Already running"},
                {"running", true},
                {"error", nullptr}
            };
            return createResponse(200, createSuccessResponse(response_data));
        }

        // Body is optional; it may name a different source
        SourceSpec source = default_source_;
        if (!req.body.empty()) {
            json request_data = parseRequestBody(req.body);
            if (!parseSourceRequest(request_data, source)) {
                return createResponse(400, createErrorResponse(
                    "Invalid request format. Optional: video (string) or camera (integer)"));
            }
        }

        if (!session_->start(config_, source, log_enabled_)) {
            // Lost a race with another start request
            if (session_->isRunning()) {
                return createResponse(200, createSuccessResponse({{"message", "Already running"},
                                                                  {"running", true},
                                                                  {"error", nullptr}}));
            }
            json error_response = createErrorResponse(session_->lastError(), 500);
            error_response["running"] = false;
            error_response["processing_time_ms"] = timer.elapsed_ms();
            return createResponse(500, error_response);
        }

        json response_data = {
            {"message", "Pipeline started"},
            {"running", true},
            {"source", source.describe()},
            {"processing_time_ms", timer.elapsed_ms()},
            {"error", nullptr}
        };
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const std::exception& e) {
        std::cerr << "[Server] Error starting session: " << e.what() << std::endl;
        json error_response = createErrorResponse(e.what(), 400);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(400, error_response);
    }
}

crow::response WebServer::handleSessionStop(const crow::request& req) {
    Timer timer;

    try {
        bool clean = session_->stop();

        json response_data = {
            {"message", "Pipeline stopped"},
            {"running", false},
            {"stopped_cleanly", clean},
            {"processing_time_ms", timer.elapsed_ms()},
            {"error", nullptr}
        };
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const std::exception& e) {
        std::cerr << "[Server] Error stopping session: " << e.what() << std::endl;
        return createResponse(500, createErrorResponse("Internal server error", 500));
    }
}

crow::response WebServer::handleSessionStatus(const crow::request& req) {
    try {
        auto latest = session_->latest();
        std::string error = session_->lastError();

        json response_data = {
            {"running", session_->isRunning()},
            {"face_detected", latest ? latest->face_detected : false},
            {"fps", latest ? latest->fps : 0.0},
            {"inference_ms", latest ? latest->inference_ms : 0.0},
            {"frame_number", latest ? latest->frame_number : 0},
            {"error", error.empty() ? json(nullptr) : json(error)}
        };
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const std::exception& e) {
        std::cerr << "[Server] Error reading session status: " << e.what() << std::endl;
        return createResponse(500, createErrorResponse("Internal server error", 500));
    }
}

crow::response WebServer::handleMetrics(const crow::request& req) {
    try {
        if (!session_->isRunning()) {
            return createResponse(503, createErrorResponse(
                "Pipeline not running. POST /session/start first.", 503));
        }

        auto latest = session_->latest();
        EngagementResult snapshot = latest ? *latest : EngagementResult();

        json response_data = snapshot.toJson();
        response_data["engagement_color"] = scoreColor(snapshot.engagement_score);
        response_data["error"] = nullptr;
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const std::exception& e) {
        std::cerr << "[Server] Error reading metrics: " << e.what() << std::endl;
        return createResponse(500, createErrorResponse("Internal server error", 500));
    }
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid JSON in request body");
    }
}

bool WebServer::parseSourceRequest(const json& request_data, SourceSpec& source) {
    if (!request_data.is_object()) {
        return false;
    }

    if (request_data.contains("video")) {
        if (!request_data["video"].is_string() || request_data["video"].get<std::string>().empty()) {
            return false;
        }
        source = SourceSpec::file(request_data["video"].get<std::string>());
        return true;
    }

    if (request_data.contains("camera")) {
        const json& camera = request_data["camera"];
        if (!camera.is_number_integer() || !fitsInt(camera) || camera.get<int>() < 0) {
            return false;
        }
        source = SourceSpec::camera(camera.get<int>());
    }
    return true;
}

json WebServer::createErrorResponse(const std::string& error_message, int status_code) {
    return json{
        {"success", false},
        {"error", error_message},
        {"status_code", status_code}
    };
}

json WebServer::createSuccessResponse(const json& data) {
    json response = data;
    response["success"] = true;
    return response;
}

crow::response WebServer::createResponse(int status_code, const json& data) {
    crow::response res(status_code, data.dump());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", "application/json");
    return res;
}

std::string WebServer::scoreColor(double score) {
    if (score >= 65.0) return "green";
    if (score >= 35.0) return "yellow";
    return "red";
}

} // namespace engagement
