/**
 * @file Log.hpp
 * @brief Levelled logging for the library and the command line tool
 *
 * Usage:
 * @code
 *   gura::Log::debug("Importing " + path);
 *   gura::Log::set_level(gura::LogLevel::Debug);
 *   gura::Log::set_callback([](gura::LogLevel, const std::string& msg) { ... });
 * @endcode
 *
 * Messages below the current level are dropped. Without a callback,
 * messages go to std::cerr as `[gura] LEVEL: message`.
 */

#ifndef GURA_LOG_HPP
#define GURA_LOG_HPP

#include <exception>
#include <functional>
#include <string>

namespace gura {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* level_name(LogLevel level) noexcept;

class Log {
public:
    using Callback = std::function<void(LogLevel, const std::string&)>;

    static void debug(const std::string& msg) { write(LogLevel::Debug, msg); }
    static void info(const std::string& msg) { write(LogLevel::Info, msg); }
    static void warn(const std::string& msg) { write(LogLevel::Warn, msg); }
    static void error(const std::string& msg) { write(LogLevel::Error, msg); }

    // Exception logging with context
    static void error(const std::exception& e, const std::string& context = "") {
        write(LogLevel::Error, context.empty() ? e.what() : context + ": " + e.what());
    }

    static void set_level(LogLevel level) noexcept;
    static LogLevel level() noexcept;

    /**
     * @brief Intercept messages, an empty callback restores std::cerr output
     */
    static void set_callback(Callback callback);

    static void write(LogLevel level, const std::string& msg);
};

} // namespace gura

#endif // GURA_LOG_HPP
