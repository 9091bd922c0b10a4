/*
 * Logger.cpp
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

#include "Logger.h"
#include <iostream>

Logger* Logger::g_logger = nullptr;

static const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

Logger::Logger(std::ostream& out, LogLevel threshold)
    : out(out), threshold(threshold), t0(std::chrono::steady_clock::now()) {}

void Logger::log_ts(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!enabled(level))
        return;
    auto now = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - t0).count();

    std::lock_guard<std::mutex> lk(mu);
    out << "t=" << ms << "ms " << level_name(level) << " " << tag << " " << msg << "\n";
    out.flush();
}

Logger& Logger::global() {
    static Logger fallback(std::cerr);
    return g_logger ? *g_logger : fallback;
}

void Logger::set_global(Logger* logger) {
    g_logger = logger;
}
