#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <memory>
#include <vector>
#include "ring_buffers.hpp"

enum LogLevel {
    NOTSET,
    ERROR,
    WARN,
    INFO,
    DEBUG,
};

std::optional<LogLevel> log_level_from_str(const std::string& name);

const char* log_level_as_str(LogLevel level);

class AsyncLogger {
public:
    // "stdout" writes to standard output, anything else is opened as a file
    // in append mode.
    explicit AsyncLogger(const std::string& filename);

    ~AsyncLogger();

    void write(std::string message);

    // Blocks until every message pushed so far has been written.
    void flush();

private:
    void display_loop();

    MPSCRingBuffer<std::string> messages;
    int fd;
    std::condition_variable cv;
    std::condition_variable drained_cv;
    std::mutex mu;
    bool done;
    bool ready_to_read;
    std::atomic<std::size_t> pushed = 0;
    std::atomic<std::size_t> written = 0;
    std::thread logger;
};

// In-memory copy of every line logged while attached, for callers that
// follow a run without reading stdout.
class LineStream {
public:
    void append(const std::string& line);

    std::vector<std::string> since(std::size_t idx) const;

    std::size_t size() const;

private:
    mutable std::mutex mu;
    std::vector<std::string> lines;
};

struct LoggingContext {
    std::atomic<LogLevel> level;
    AsyncLogger logger;

    LoggingContext(const std::string& filename, LogLevel level);

    ~LoggingContext() = default;

    void set_level(LogLevel new_level);

    bool enabled(LogLevel at) const;

    void debug(std::string message);

    void info(std::string message);

    void warn(std::string message);

    void error(std::string message);

    // Unprefixed line, written at INFO. Used for the report and progress stream.
    void raw(std::string message);

    void flush();

    void attach(std::shared_ptr<LineStream> stream);

    void detach(const std::shared_ptr<LineStream>& stream);

private:
    void emit(std::string line);

    std::mutex taps_mu;
    std::vector<std::shared_ptr<LineStream>> taps;
};

extern LoggingContext Logger;
