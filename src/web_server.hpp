#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "engagement_config.hpp"
#include "frame_source.hpp"
#include "monitor_session.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace engagement {

// HTTP front end over one MonitorSession. Readers only ever see the latest
// completed snapshot.
class WebServer {
public:
    WebServer(ConfigPtr config, std::string models_path, SourceSpec default_source, bool log_enabled);
    ~WebServer();

    // Register routes
    bool initialize();

    // Blocks until stop()
    void start(int port = 8001);

    void stop();

    MonitorSession& session() { return *session_; }

    static constexpr const char* SERVICE_NAME = "Engagement Monitor";
    static constexpr const char* VERSION = "1.0.0";

    // Endpoint handlers
    crow::response handleHealthCheck(const crow::request& req);
    crow::response handleSessionStart(const crow::request& req);
    crow::response handleSessionStop(const crow::request& req);
    crow::response handleSessionStatus(const crow::request& req);
    crow::response handleMetrics(const crow::request& req);

    // Optional start body: {"video": path} or {"camera": index}. False when
    // malformed; `source` is left alone when neither key is present.
    static bool parseSourceRequest(const json& request_data, SourceSpec& source);

    // green >= 65, yellow >= 35, red below
    static std::string scoreColor(double score);

private:
    ConfigPtr config_;
    std::string models_path_;
    SourceSpec default_source_;
    bool log_enabled_;

    std::unique_ptr<MonitorSession> session_;

    crow::SimpleApp app_;
    bool initialized_;

    // Helper methods
    json parseRequestBody(const std::string& body);
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);

    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point start_time;
    public:
        Timer() : start_time(std::chrono::high_resolution_clock::now()) {}

        int64_t elapsed_ms() const {
            auto end_time = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        }
    };
};

} // namespace engagement

#endif // WEB_SERVER_HPP
