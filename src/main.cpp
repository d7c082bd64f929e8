#include "engagement_config.hpp"
#include "monitor_session.hpp"
#include "web_server.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using engagement::ConfigPtr;
using engagement::EngagementConfig;
using engagement::EngagementResult;
using engagement::MonitorSession;
using engagement::SourceSpec;
using engagement::WebServer;

// Global server instance for signal handling
std::unique_ptr<WebServer> global_server;
volatile std::sig_atomic_t stop_requested = 0;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    stop_requested = 1;
    if (global_server) {
        global_server->stop();
    }
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT        Server port (default: 8001)\n"
              << "  --config FILE      JSON configuration file (default: $ENGAGEMENT_CONFIG)\n"
              << "  --models PATH      Path to models directory (default: ./models)\n"
              << "  --camera INDEX     Capture from camera INDEX (default: from config)\n"
              << "  --video FILE       Process a video file instead of a camera\n"
              << "  --no-log           Do not write the session CSV\n"
              << "  --headless         Run one session in the foreground, no HTTP server\n"
              << "  --help             Show this help message\n"
              << std::endl;
}

void printSummary(const EngagementResult& r) {
    std::cout << std::fixed << std::setprecision(1)
              << "[frame " << r.frame_number << "] ";
    if (!r.face_detected) {
        std::cout << "no face" << std::endl;
        return;
    }
    std::cout << "engagement=" << r.engagement_score
              << " confusion=" << r.confusion_score
              << " blinks=" << r.blink_count
              << " (" << r.blinks_per_minute << "/min)"
              << " tilt=" << r.tilt_angle_deg
              << (r.is_sleeping ? " SLEEPING" : "")
              << (r.is_tilted ? " TILTED" : "")
              << (r.eye_contact ? "" : " LOOKING_AWAY")
              << " fps=" << r.fps << std::endl;
}

int runHeadless(ConfigPtr config, const std::string& models_path, const SourceSpec& source,
                bool log_enabled) {
    MonitorSession session(models_path);
    session.setResultCallback([](const EngagementResult& result) {
        if (result.frame_number % 30 == 0) {
            printSummary(result);
        }
    });

    if (!session.start(config, source, log_enabled)) {
        std::cerr << "Failed to start session: " << session.lastError() << std::endl;
        return 1;
    }

    while (!stop_requested && !session.waitFinished(std::chrono::milliseconds(200))) {
    }
    session.stop();

    std::string error = session.lastError();
    if (!error.empty()) {
        std::cerr << "Session ended with error: " << error << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Default configuration
    int port = 8001;
    std::string models_path = "./models";
    std::string config_path;
    bool log_enabled = true;
    bool headless = false;
    bool camera_given = false;
    int camera_index = 0;
    std::string video_path;

    if (const char* env_config = std::getenv("ENGAGEMENT_CONFIG")) {
        config_path = env_config;
    }

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
                if (port < 1 || port > 65535) {
                    std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                    return 1;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid port number" << std::endl;
                return 1;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--models" && i + 1 < argc) {
            models_path = argv[++i];
        } else if (arg == "--camera" && i + 1 < argc) {
            try {
                camera_index = std::stoi(argv[++i]);
                if (camera_index < 0) {
                    std::cerr << "Error: Camera index must be non-negative" << std::endl;
                    return 1;
                }
                camera_given = true;
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid camera index" << std::endl;
                return 1;
            }
        } else if (arg == "--video" && i + 1 < argc) {
            video_path = argv[++i];
        } else if (arg == "--no-log") {
            log_enabled = false;
        } else if (arg == "--headless") {
            headless = true;
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (camera_given && !video_path.empty()) {
        std::cerr << "Error: --camera and --video are mutually exclusive" << std::endl;
        return 1;
    }

    // Configuration is validated before anything runs
    ConfigPtr config;
    try {
        if (config_path.empty()) {
            config = EngagementConfig::defaults();
        } else {
            config = std::make_shared<const EngagementConfig>(EngagementConfig::loadFromFile(config_path));
        }
    } catch (const std::exception& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
        return 1;
    }

    // Validate models directory
    if (!std::filesystem::exists(models_path)) {
        std::cerr << "Error: Models directory does not exist: " << models_path << std::endl;
        std::cerr << "It must contain " << config->landmark_model << std::endl;
        return 1;
    }

    SourceSpec source = video_path.empty()
        ? SourceSpec::camera(camera_given ? camera_index : config->camera_index)
        : SourceSpec::file(video_path);

    // Setup signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        std::cout << "=== Engagement Monitor ===" << std::endl;
        std::cout << "Source: " << source.describe() << std::endl;
        std::cout << "Models path: " << models_path << std::endl;
        std::cout << "Landmark layout: " << config->landmark_layout << std::endl;
        std::cout << "Session log: " << (log_enabled ? config->log_dir : "disabled") << std::endl;
        std::cout << "==========================" << std::endl;

        if (headless) {
            return runHeadless(config, models_path, source, log_enabled);
        }

        // Create and initialize server
        global_server = std::make_unique<WebServer>(config, models_path, source, log_enabled);

        if (!global_server->initialize()) {
            std::cerr << "Failed to initialize server" << std::endl;
            return 1;
        }

        // Auto-start, as when the service is launched directly
        if (!global_server->session().start(config, source, log_enabled)) {
            std::cerr << "Warning: initial session did not start: "
                      << global_server->session().lastError() << std::endl;
        }

        std::cout << "\nServer ready on port " << port << ". Available endpoints:" << std::endl;
        std::cout << "  GET  /health           - Health check" << std::endl;
        std::cout << "  POST /session/start    - Start capture and inference" << std::endl;
        std::cout << "  POST /session/stop     - Stop capture and inference" << std::endl;
        std::cout << "  GET  /session/status   - Running state, FPS, last error" << std::endl;
        std::cout << "  GET  /metrics          - Latest engagement snapshot" << std::endl;
        std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

        // Start server (blocking call)
        global_server->start(port);
        global_server->stop();
        global_server.reset();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
