#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

mablocks::log::Level& global_level() {
    static mablocks::log::Level lvl = mablocks::log::Level::Info;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool env_flag_set(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("MABLOCKS_LOG_LEVEL")) {
        global_level() = mablocks::log::parse_level(v);
    }

    const char* file = std::getenv("MABLOCKS_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        if (env_flag_set(std::getenv("MABLOCKS_LOG_APPEND"))) mode |= std::ios::app; else mode |= std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
}

const char* level_tag(mablocks::log::Level level) {
    switch (level) {
        case mablocks::log::Level::Error: return "ERROR";
        case mablocks::log::Level::Warn:  return "WARN";
        case mablocks::log::Level::Info:  return "INFO";
        case mablocks::log::Level::Debug: return "DEBUG";
        default:                          return "INFO";
    }
}

void log_line_impl(mablocks::log::Level level, const std::string& message) {
    init_from_env_once();
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << '[' << level_tag(level) << "] +" << std::setprecision(3) << secs << "s: " << message << '\n';
    const std::string line = ss.str();

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostream& os = (level == mablocks::log::Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace mablocks::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

Level parse_level(const std::string& value, Level fallback) {
    std::string lower = value;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return fallback;
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(log_mutex());
    time_origin() = std::chrono::steady_clock::now();
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

Channel::Channel(std::string component)
    : component_(std::move(component)), prefix_("[" + component_ + "] ") {}

std::string Channel::tagged(const std::string& message) const {
    return prefix_ + message;
}

void Channel::error(const std::string& message) const { log_line_impl(Level::Error, tagged(message)); }
void Channel::warn (const std::string& message) const { log_line_impl(Level::Warn,  tagged(message)); }
void Channel::info (const std::string& message) const { log_line_impl(Level::Info,  tagged(message)); }
void Channel::debug(const std::string& message) const { log_line_impl(Level::Debug, tagged(message)); }

}
