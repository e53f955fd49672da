#pragma once

/**
 * Process-wide logger, created on first use from the log_level and
 * log_file options. Its output goes to stdout, to a file, or to the
 * systemd journal when stdout is connected to it.
 *
 * Always log through the log_debug(), log_info(), log_warning() and
 * log_error() macros, they take any number of streamable arguments.
 */

#include <memory>
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>

#define debug_lvl 0
#define info_lvl 1
#define warning_lvl 2
#define error_lvl 3

#include <passerelle.h>
#ifdef SYSTEMD_FOUND
#define SD_JOURNAL_SUPPRESS_LOCATION
# include <systemd/sd-journal.h>
#else
# define LOG_ERR 3
# define LOG_WARNING 4
# define LOG_INFO 6
# define LOG_DEBUG 7
#endif

// Set by the build system to the path relative to the project root
#ifndef __FILENAME__
# define __FILENAME__ __FILE__
#endif

/**
 * Swallows everything written into it. Backs the stream returned for
 * the levels below the configured one.
 */
class NullBuffer: public std::streambuf
{
 public:
  int overflow(int c) override { return c; }
};

class Logger
{
public:
  static std::unique_ptr<Logger>& instance();

  explicit Logger(const int log_level);
  Logger(const int log_level, const std::string& log_file);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  /**
   * The stream to write a message of that level into, a null stream if
   * the message must be dropped. The "[LEVEL]: file:line:\t" header is
   * already written.
   */
  std::ostream& start_entry(const int level, const char* src_file, const int line);

  /**
   * Convert the value of the log_level option into one of the *_lvl
   * values. Accepts a number (0 to 3) or a level name ("debug", "info",
   * "warning", "error"). Anything else means debug.
   */
  static int parse_level(const std::string& value);
  /**
   * The syslog priority sent to the journal for a *_lvl value.
   */
  static int syslog_priority(const int level);

  bool writes_to_journal() const
  {
    return this->journal;
  }

private:
  const int log_level;
  bool journal{false};
  std::ofstream ofstream{};
  std::ostream stream;

  NullBuffer null_buffer;
  std::ostream null_stream;
};

namespace logging_details
{
  template <typename T>
  void log(std::ostream& os, const T& arg)
  {
    os << arg << std::endl;
  }

  template <typename T, typename... U>
  void log(std::ostream& os, const T& first, U&&... rest)
  {
    os << first;
    log(os, std::forward<U>(rest)...);
  }

  template <typename... U>
  void do_logging(const int level, const char* src_file, const int line, U&&... args)
  {
    auto& logger = Logger::instance();
#ifdef SYSTEMD_FOUND
    if (logger->writes_to_journal())
      {
        std::ostringstream os;
        log(os, std::forward<U>(args)...);
        sd_journal_send("MESSAGE=%s", os.str().data(),
                        "PRIORITY=%i", Logger::syslog_priority(level),
                        "CODE_FILE=%s", src_file,
                        "CODE_LINE=%i", line,
                        nullptr);
        return;
      }
#endif
    log(logger->start_entry(level, src_file, line), std::forward<U>(args)...);
  }
}

#define log_debug(...) logging_details::do_logging(debug_lvl, __FILENAME__, __LINE__, __VA_ARGS__)

#define log_info(...) logging_details::do_logging(info_lvl, __FILENAME__, __LINE__, __VA_ARGS__)

#define log_warning(...) logging_details::do_logging(warning_lvl, __FILENAME__, __LINE__, __VA_ARGS__)

#define log_error(...) logging_details::do_logging(error_lvl, __FILENAME__, __LINE__, __VA_ARGS__)
