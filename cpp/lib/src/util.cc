/** \file    util.cc
 *  \brief   Implementation of the process-wide logger.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
    Copyright (C) 2015-2020 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "util.h"
#include <sstream>
#include <thread>
#include <chrono>
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <ctime>


char *progname; // Must be set in main() with "progname = argv[0];";


const std::string Logger::FUNCTION_NAME_SEPARATOR(" --> ");


namespace {


bool EnvironmentVariableContains(const char * const variable_name, const char * const needle) {
    const char * const value(::getenv(variable_name));
    return value != nullptr and std::strstr(value, needle) != nullptr;
}


// \return E.g. "2024-03-01T12:34:56.789Z".
std::string GetCurrentTimestamp() {
    const auto now(std::chrono::system_clock::now());
    const time_t now_in_seconds(std::chrono::system_clock::to_time_t(now));
    const auto milliseconds(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    struct tm tm;
    ::gmtime_r(&now_in_seconds, &tm);
    char buffer[sizeof("2000-01-01T00:00:00.000Z")];
    const size_t length(std::strftime(buffer, sizeof buffer, "%Y-%m-%dT%H:%M:%S", &tm));
    std::snprintf(buffer + length, sizeof(buffer) - length, ".%03dZ", static_cast<int>(milliseconds));

    return buffer;
}


const char *LogLevelLabel(const Logger::LogLevel log_level) {
    switch (log_level) {
    case Logger::LL_ERROR:
        return "SEVERE";
    case Logger::LL_WARNING:
        return "WARN";
    case Logger::LL_INFO:
        return "INFO";
    case Logger::LL_DEBUG:
        return "DEBUG";
    }

    return "?";
}


} // unnamed namespace


Logger::Logger()
    : min_log_level_(LL_INFO), log_no_decorations_(EnvironmentVariableContains("LOGGER_FORMAT", "no_decorations")),
      log_strip_call_site_(EnvironmentVariableContains("LOGGER_FORMAT", "strip_call_site")),
      log_process_pids_(EnvironmentVariableContains("LOGGER_FORMAT", "process_pids")),
      log_thread_ids_(EnvironmentVariableContains("LOGGER_FORMAT", "thread_ids"))
{
    const char * const min_log_level(::getenv("MIN_LOG_LEVEL"));
    if (min_log_level != nullptr)
        min_log_level_ = StringToLogLevel(min_log_level);
}


void Logger::error(const std::string &function_name, const std::string &msg) {
    std::string full_message(msg);
    if (errno != 0)
        full_message += " (last errno error code: " + std::string(std::strerror(errno)) + ")";

    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        writeLine(formatMessage(LL_ERROR, function_name, full_message));
    }
    std::exit(EXIT_FAILURE);
}


Logger::LogLevel Logger::StringToLogLevel(const std::string &level_candidate) {
    if (level_candidate == "ERROR")
        return LL_ERROR;
    if (level_candidate == "WARNING")
        return LL_WARNING;
    if (level_candidate == "INFO")
        return LL_INFO;
    if (level_candidate == "DEBUG")
        return LL_DEBUG;

    // We may be called while "logger" is still being constructed.
    std::cerr << "not a valid minimum log level: \"" << level_candidate << "\"! (Use ERROR, WARNING, INFO or DEBUG)\n";
    std::exit(EXIT_FAILURE);
}


void Logger::log(const LogLevel log_level, const std::string &function_name, const std::string &msg) {
    if (not isEnabled(log_level))
        return;

    const std::string line(formatMessage(log_level, function_name, msg));
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeLine(line);
}


std::string Logger::formatMessage(const LogLevel log_level, const std::string &function_name, const std::string &msg) const {
    std::string line;
    if (not log_no_decorations_) {
        line = GetCurrentTimestamp() + " " + LogLevelLabel(log_level) + " " + (::progname != nullptr ? ::progname : "?");
        if (log_process_pids_)
            line += " [" + std::to_string(::getpid()) + "]";
        if (log_thread_ids_) {
            std::ostringstream thread_id;
            thread_id << std::this_thread::get_id();
            line += " {" + thread_id.str() + "}";
        }
        line += ": ";
    }

    if (not log_strip_call_site_)
        line += "in " + function_name + FUNCTION_NAME_SEPARATOR;
    line += msg;
    line += '\n';

    return line;
}


void Logger::writeLine(const std::string &line) {
    if (unlikely(::write(STDERR_FILENO, line.data(), line.size()) == -1)) {
        const std::string error_message("in Logger::writeLine(util.cc): write(2) failed! (errno = " + std::to_string(errno) + ")\n");
        const ssize_t dummy = ::write(STDERR_FILENO, error_message.data(), error_message.size());
        (void)dummy;
        _exit(EXIT_FAILURE);
    }
}


Logger *logger(new Logger());
