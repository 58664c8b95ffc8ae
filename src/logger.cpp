#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <algorithm>
#include <stdexcept>
#include <unistd.h>

std::optional<LogLevel> log_level_from_str(const std::string& name) {
    if (name == "error") return ERROR;
    if (name == "warn") return WARN;
    if (name == "info") return INFO;
    if (name == "debug") return DEBUG;
    return std::nullopt;
}

const char* log_level_as_str(LogLevel level) {
    switch (level) {
        case ERROR: return "ERROR";
        case WARN: return "WARN";
        case INFO: return "INFO";
        case DEBUG: return "DEBUG";
        default: return "NOTSET";
    }
}

AsyncLogger::AsyncLogger(const std::string& filename) : done(false), ready_to_read(false) {
    if (filename == "stdout") {
        fd = STDOUT_FILENO;
    } else {
        fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd == -1) {
            throw std::runtime_error("Could not open log file " + filename + ": " + std::strerror(errno));
        }
    }
    // Deploy logger thread
    logger = std::thread(&AsyncLogger::display_loop, this);
}

AsyncLogger::~AsyncLogger() {
    {
        std::lock_guard<std::mutex> lock(mu);
        done = true;
        ready_to_read = true;
    }
    cv.notify_one();  // Make sure the display loop isn't stuck waiting to be able to query `done`
    logger.join();
    if (fd != STDOUT_FILENO) {
        close(fd);
    }
}

void AsyncLogger::write(std::string message) {
    message += '\n';
    // The ring only refuses a push when the display loop has fallen a full
    // buffer behind, so wake it and try again.
    while (messages.push(message) == RingState::FULL) {
        cv.notify_one();
        std::this_thread::yield();
    }
    pushed.fetch_add(1, std::memory_order_acq_rel);
    {
        std::lock_guard<std::mutex> lock(mu);
        ready_to_read = true;
    }
    cv.notify_one();
}

void AsyncLogger::flush() {
    auto target = pushed.load(std::memory_order_acquire);
    std::unique_lock<std::mutex> lock(mu);
    drained_cv.wait(lock, [this, target] {
        return written.load(std::memory_order_acquire) >= target;
    });
}

void AsyncLogger::display_loop() {
    while (true) {
        bool finishing;
        {
            std::unique_lock<std::mutex> lock(mu);
            cv.wait(lock, [this] { return ready_to_read || done; });
            ready_to_read = false;
            finishing = done;
        }
        while (true) {
            auto to_display = messages.fetch();
            if (to_display.state != RingState::SUCCESS) {
                break;
            }
            const auto& msg = to_display.content.value();
            std::size_t offset = 0;
            while (offset < msg.size()) {
                auto n = ::write(fd, msg.data() + offset, msg.size() - offset);
                if (n <= 0) {
                    if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    break;
                }
                offset += static_cast<std::size_t>(n);
            }
            written.fetch_add(1, std::memory_order_acq_rel);
        }
        {
            std::lock_guard<std::mutex> lock(mu);
            drained_cv.notify_all();
        }
        if (finishing && messages.is_empty()) {
            break;
        }
    }
}

LoggingContext::LoggingContext(const std::string& filename, LogLevel level) : level(level), logger(filename) {
}

void LoggingContext::set_level(LogLevel new_level) {
    level.store(new_level, std::memory_order_release);
}

bool LoggingContext::enabled(LogLevel at) const {
    return level.load(std::memory_order_acquire) >= at;
}

void LoggingContext::debug(std::string message) {
    if (enabled(DEBUG)) {
        emit("DEBUG: " + std::move(message));
    }
}

void LoggingContext::info(std::string message) {
    if (enabled(INFO)) {
        emit("INFO: " + std::move(message));
    }
}

void LoggingContext::warn(std::string message) {
    if (enabled(WARN)) {
        emit("WARN: " + std::move(message));
    }
}

void LoggingContext::error(std::string message) {
    if (enabled(ERROR)) {
        emit("ERROR: " + std::move(message));
    }
}

void LoggingContext::raw(std::string message) {
    if (enabled(INFO)) {
        emit(std::move(message));
    }
}

void LoggingContext::flush() {
    logger.flush();
}

void LoggingContext::emit(std::string line) {
    {
        std::lock_guard<std::mutex> lock(taps_mu);
        for (const auto& tap : taps) {
            tap->append(line);
        }
    }
    logger.write(std::move(line));
}

void LoggingContext::attach(std::shared_ptr<LineStream> stream) {
    std::lock_guard<std::mutex> lock(taps_mu);
    taps.emplace_back(std::move(stream));
}

void LoggingContext::detach(const std::shared_ptr<LineStream>& stream) {
    std::lock_guard<std::mutex> lock(taps_mu);
    taps.erase(std::remove(taps.begin(), taps.end(), stream), taps.end());
}

void LineStream::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mu);
    lines.push_back(line);
}

std::vector<std::string> LineStream::since(std::size_t idx) const {
    std::lock_guard<std::mutex> lock(mu);
    if (idx >= lines.size()) {
        return {};
    }
    return std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(idx), lines.end());
}

std::size_t LineStream::size() const {
    std::lock_guard<std::mutex> lock(mu);
    return lines.size();
}
