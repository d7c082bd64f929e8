#include "session_logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace engagement {

const char* const SessionLogger::CSV_HEADER =
    "timestamp,frame_number,sleep_state,tilt_state,tilt_angle_deg,blink_count,"
    "blinks_per_minute,eye_contact,engagement_score,confusion_score,head_nod,head_shake,"
    "ear_left,ear_right,ear_avg";

namespace {

std::tm localTime(std::time_t t) {
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return tm_buf;
}

std::string fixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

} // namespace

SessionLogger::SessionLogger(const std::string& file_path, int flush_rows)
    : file_path_(file_path), flush_rows_(flush_rows > 0 ? flush_rows : 1), row_count_(0) {
    std::filesystem::path parent = std::filesystem::path(file_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create log directory " + parent.string() + ": " +
                                     ec.message());
        }
    }

    file_.open(file_path_, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open session log: " + file_path_);
    }

    file_ << CSV_HEADER << '\n';
    file_.flush();
    std::cout << "[Logger] Session log -> " << file_path_ << std::endl;
}

SessionLogger::~SessionLogger() {
    close();
}

std::string SessionLogger::sessionFilePath(const std::string& log_dir) {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_now = localTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream stem;
    stem << "session_" << std::put_time(&tm_now, "%Y%m%d_%H%M%S") << '_'
         << std::setfill('0') << std::setw(3) << ms.count();

    // Never reuse a file an earlier session wrote
    std::filesystem::path path = std::filesystem::path(log_dir) / (stem.str() + ".csv");
    for (int n = 1; std::filesystem::exists(path); n++) {
        path = std::filesystem::path(log_dir) / (stem.str() + "_" + std::to_string(n) + ".csv");
    }
    return path.string();
}

std::string SessionLogger::isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_now = localTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream ss;
    ss << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string SessionLogger::formatRow(const std::string& timestamp, const EngagementResult& r) {
    std::ostringstream row;
    row << timestamp << ','
        << r.frame_number << ','
        << (r.is_sleeping ? 1 : 0) << ','
        << (r.is_tilted ? 1 : 0) << ','
        << fixed(r.tilt_angle_deg, 2) << ','
        << r.blink_count << ','
        << fixed(r.blinks_per_minute, 1) << ','
        << (r.eye_contact ? 1 : 0) << ','
        << fixed(r.engagement_score, 1) << ','
        << fixed(r.confusion_score, 1) << ','
        << (r.head_nod ? 1 : 0) << ','
        << (r.head_shake ? 1 : 0) << ','
        << fixed(r.ear_left, 4) << ','
        << fixed(r.ear_right, 4) << ','
        << fixed(r.ear_avg, 4);
    return row.str();
}

void SessionLogger::writeRow(const EngagementResult& result) {
    if (!file_.is_open()) {
        return;
    }

    file_ << formatRow(isoTimestamp(), result) << '\n';
    row_count_++;

    if (row_count_ % flush_rows_ == 0) {
        file_.flush();
    }
    if (!file_) {
        throw std::runtime_error("Write failed on session log: " + file_path_);
    }
}

void SessionLogger::close() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
        std::cout << "[Logger] Session saved: " << row_count_ << " rows -> " << file_path_
                  << std::endl;
    }
}

} // namespace engagement
