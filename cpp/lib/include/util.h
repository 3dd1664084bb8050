/** \file   util.h
 *  \brief  The process-wide logger and a few macros everything else uses.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2014-2020 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <mutex>
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>


#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif


/** \brief  A thread-safe logger that writes one line per message to stderr.
 *  \note   The environment variable MIN_LOG_LEVEL sets the initial minimum level (ERROR, WARNING, INFO or DEBUG, default
 *          INFO).  LOGGER_FORMAT may contain any combination of "no_decorations", "strip_call_site", "process_pids"
 *          and "thread_ids".
 */
class Logger {
public:
    enum LogLevel { LL_ERROR = 1, LL_WARNING = 2, LL_INFO = 3, LL_DEBUG = 4 };
    static const std::string FUNCTION_NAME_SEPARATOR;
private:
    std::mutex mutex_;
    LogLevel min_log_level_;
    bool log_no_decorations_, log_strip_call_site_, log_process_pids_, log_thread_ids_;
public:
    Logger();

    void setMinimumLogLevel(const LogLevel min_log_level) { min_log_level_ = min_log_level; }
    inline bool isEnabled(const LogLevel log_level) const { return log_level <= min_log_level_; }

    /** Emits "msg", including the text for a non-zero errno, and then calls exit(3). */
    [[noreturn]] void error(const std::string &function_name, const std::string &msg);

    void warning(const std::string &function_name, const std::string &msg) { log(LL_WARNING, function_name, msg); }
    void info(const std::string &function_name, const std::string &msg) { log(LL_INFO, function_name, msg); }
    void debug(const std::string &function_name, const std::string &msg) { log(LL_DEBUG, function_name, msg); }

    /** \note Exits if "level_candidate" is not one of "ERROR", "WARNING", "INFO" or "DEBUG". */
    static LogLevel StringToLogLevel(const std::string &level_candidate);
private:
    void log(const LogLevel log_level, const std::string &function_name, const std::string &msg);
    std::string formatMessage(const LogLevel log_level, const std::string &function_name, const std::string &msg) const;
    void writeLine(const std::string &line);
};
extern Logger *logger;


#define LOG_ERROR(message) logger->error(__PRETTY_FUNCTION__, message)
#define LOG_WARNING(message) logger->warning(__PRETTY_FUNCTION__, message)
#define LOG_INFO(message) logger->info(__PRETTY_FUNCTION__, message)
#define LOG_DEBUG(message) (logger->isEnabled(Logger::LL_DEBUG) ? logger->debug(__PRETTY_FUNCTION__, message) : (void)0)


/** Must be set to point to argv[0] in main(). */
extern char *progname;
