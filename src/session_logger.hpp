#ifndef SESSION_LOGGER_HPP
#define SESSION_LOGGER_HPP

#include "engagement_result.hpp"
#include <fstream>
#include <string>

namespace engagement {

// Append-only CSV log of sampled snapshots, one file per session.
class SessionLogger {
public:
    static const char* const CSV_HEADER;

    // Opens `file_path` and writes the header. Parent directories are created
    // if missing. Throws std::runtime_error when the file cannot be opened.
    SessionLogger(const std::string& file_path, int flush_rows);
    ~SessionLogger();

    SessionLogger(const SessionLogger&) = delete;
    SessionLogger& operator=(const SessionLogger&) = delete;

    // <log_dir>/session_YYYYmmdd_HHMMSS_mmm.csv for the current local time,
    // with a _N suffix when that file already exists
    static std::string sessionFilePath(const std::string& log_dir);

    void writeRow(const EngagementResult& result);
    void close();

    const std::string& filePath() const { return file_path_; }
    int rowCount() const { return row_count_; }

    // One CSV line without the trailing newline
    static std::string formatRow(const std::string& timestamp, const EngagementResult& result);

    // Local time, YYYY-mm-ddTHH:MM:SS.mmm
    static std::string isoTimestamp();

private:
    std::string file_path_;
    std::ofstream file_;
    int flush_rows_;
    int row_count_;
};

} // namespace engagement

#endif // SESSION_LOGGER_HPP
