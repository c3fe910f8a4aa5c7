/**
 * @file Log.cpp
 * @brief Logging sink and level filter
 */

#include "gura/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace gura {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};
std::mutex g_mutex;
Log::Callback g_callback;

} // anonymous namespace

const char* level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void Log::set_level(LogLevel level) noexcept {
    g_level.store(level);
}

LogLevel Log::level() noexcept {
    return g_level.load();
}

void Log::set_callback(Callback callback) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_callback = std::move(callback);
}

void Log::write(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < static_cast<int>(g_level.load())) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_callback) {
        g_callback(level, msg);
        return;
    }
    std::cerr << "[gura] " << level_name(level) << ": " << msg << "\n";
}

} // namespace gura
