// common/logger.cpp
#include "gantry/common/logger.h"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace gantry {

namespace {

std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_level_initialized = false;
std::unordered_map<std::thread::id, std::string> g_thread_labels;

} // namespace

void Logger::set_level(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = level_from_env();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::time_t now_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&now_t, &local_tm);

        std::ostringstream line;
        line << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << level_name(level) << "]";

        std::lock_guard<std::mutex> lock(g_log_mutex);
        auto it = g_thread_labels.find(std::this_thread::get_id());
        if (it != g_thread_labels.end()) {
            line << " [" << it->second << "]";
        }
        line << " " << message;
        std::cerr << line.str() << std::endl;
    } catch (const std::exception&) {
        // logging never throws into the caller
    }
}

LogLevel Logger::parse_level(const std::string& name) noexcept {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "trace") return LogLevel::TRACE;
    return LogLevel::INFO;
}

LogLevel Logger::level_from_env() noexcept {
    const char* env_val = std::getenv("GANTRY_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return parse_level(env_val);
}

const char* Logger::level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}

void set_thread_label(const std::string& label) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_labels[std::this_thread::get_id()] = label;
}

} // namespace gantry
