#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rtvoice {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

// [LEVEL] YYYY-MM-DD HH:MM:SS.mmm: message
std::string format_line(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << '[' << level_tag(level) << "] "
         << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
         << std::setfill('0') << std::setw(3) << millis
         << ": " << message;
    return line.str();
}

std::ostream& console_for(LogLevel level) {
    return level >= LogLevel::WARN ? std::cerr : std::cout;
}

} // namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        if (output_file.empty()) return;

        std::filesystem::path path(output_file);
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: could not open log file " << output_file
                      << (ec ? " (" + ec.message() + ")" : std::string()) << std::endl;
        }
    }

    // Checked without the lock so filtered messages from the audio task stay cheap
    bool enabled(LogLevel level) const {
        return level >= min_level_.load(std::memory_order_relaxed);
    }

    void write(LogLevel level, const std::string& message) {
        std::string line = format_line(level, message);
        std::lock_guard<std::mutex> lock(mutex_);
        console_for(level) << line << std::endl;
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<LogLevel> min_level_;
    std::mutex mutex_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!impl_) {
        // Not initialized: plain console output
        console_for(level) << message << std::endl;
        return;
    }
    if (impl_->enabled(level)) {
        impl_->write(level, message);
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->level() : LogLevel::INFO;
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

} // namespace rtvoice
