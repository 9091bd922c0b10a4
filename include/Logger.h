/*
 * Logger.h
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef LOGGER_H
#define LOGGER_H

#include <chrono>
#include <iosfwd>
#include <mutex>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * @brief Line logger with a timestamp relative to its creation.
 *
 * One process-wide instance is reachable through the static helpers; worker
 * threads share it, so writes are serialized.
 */
class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel threshold = LogLevel::Info);

    void log_ts(LogLevel level, const std::string& tag, const std::string& msg);

    void set_threshold(LogLevel level) { threshold = level; }
    LogLevel get_threshold() const { return threshold; }
    bool enabled(LogLevel level) const { return level >= threshold; }

    /**
     * Process-wide logger, writing to std::cerr unless replaced.
     */
    static Logger& global();
    /**
     * Redirects the global logger; pass nullptr to restore std::cerr.
     */
    static void set_global(Logger* logger);

    static void debug(const std::string& tag, const std::string& msg) { global().log_ts(LogLevel::Debug, tag, msg); }
    static void info(const std::string& tag, const std::string& msg) { global().log_ts(LogLevel::Info, tag, msg); }
    static void warn(const std::string& tag, const std::string& msg) { global().log_ts(LogLevel::Warn, tag, msg); }
    static void error(const std::string& tag, const std::string& msg) { global().log_ts(LogLevel::Error, tag, msg); }

private:
    std::ostream& out;
    LogLevel threshold;
    std::mutex mu;
    std::chrono::steady_clock::time_point t0;

    static Logger* g_logger;
};

#endif // LOGGER_H
