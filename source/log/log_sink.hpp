#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace logx {

// Collects the tagged text operations append to `log`, keeps a bounded
// window of complete lines and appends them to a file in chunks.
class LogSink {
public:
    static constexpr size_t LOG_WINDOW_BYTES = 256 * 1024;
    static constexpr size_t LOG_FLUSH_CHUNK_BYTES = 32 * 1024;
    static constexpr size_t LOG_MAX_FILE_BYTES = 3 * 1024 * 1024;

    explicit LogSink(std::string file_path, bool echo=false);
    ~LogSink();
    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    std::string log;    // producers append here

    void drain();
    void maybeFlush();
    void flush(bool force=false);

    const std::deque<std::string>& lines() const { return log_lines; }
    size_t windowBytes() const { return log_lines_bytes; }
    const std::string& path() const { return file_path; }
    void setEcho(bool on) { echo = on; }

private:
    void enforceWindow();
    void appendLine(const std::string& line);

    std::string file_path;
    bool echo=false;
    std::deque<std::string> log_lines;
    size_t log_lines_bytes=0;
    std::string log_partial_line;
    std::string log_disk_buffer;
};

} // namespace logx
