#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "utils/string_utils.hpp"

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

tumble::log::Level& global_level() {
    static tumble::log::Level lvl = tumble::log::Level::Info;
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

bool env_flag_enabled(const char* value) {
    if (!value || !*value) {
        return false;
    }
    const char c = *value;
    return c == '1' || c == 'y' || c == 'Y' || c == 't' || c == 'T';
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("TUMBLE_LOG_LEVEL")) {
        global_level() = tumble::log::parse_level(v).value_or(tumble::log::Level::Info);
    }

    const char* file = std::getenv("TUMBLE_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        mode |= env_flag_enabled(std::getenv("TUMBLE_LOG_APPEND")) ? std::ios::app : std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
}

const char* level_tag(tumble::log::Level level) {
    switch (level) {
        case tumble::log::Level::Error: return "ERROR";
        case tumble::log::Level::Warn:  return "WARN";
        case tumble::log::Level::Info:  return "INFO";
        case tumble::log::Level::Debug: return "DEBUG";
        default:                        return "INFO";
    }
}

std::string elapsed_seconds_text() {
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << std::setprecision(3) << secs;
    return ss.str();
}

void log_line_impl(tumble::log::Level level, const std::string& message) {
    init_from_env_once();
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostream& os = (level == tumble::log::Level::Error) ? std::cerr : std::cout;
    const std::string line = std::string("[") + level_tag(level) + "] +" + elapsed_seconds_text() + "s: " + message + '\n';
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace tumble::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

std::optional<Level> parse_level(std::string_view text) {
    const std::string lower = tumble::strings::to_lower_copy(tumble::strings::trim_copy(text));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(log_mutex());
    time_origin() = std::chrono::steady_clock::now();
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

}
