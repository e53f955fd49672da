#include <logger/logger.hpp>
#include <config/config.hpp>
#include <utils/tolower.hpp>

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>

namespace
{
  const char* level_names[] = {"DEBUG", "INFO", "WARNING", "ERROR"};

  /**
   * Whether our stdout is the stream systemd opened to the journal, see
   * https://www.freedesktop.org/software/systemd/man/systemd.exec.html#%24JOURNAL_STREAM
   */
  bool stdout_is_journal()
  {
    const char* journal_stream = ::getenv("JOURNAL_STREAM");
    if (journal_stream == nullptr)
      return false;
    struct stat s{};
    if (::fstat(STDOUT_FILENO, &s) == -1)
      return false;
    return std::to_string(s.st_dev) + ":" + std::to_string(s.st_ino) == journal_stream;
  }
}

Logger::Logger(const int log_level):
  log_level(log_level),
  stream(std::cout.rdbuf()),
  null_buffer{},
  null_stream{&null_buffer}
{
#ifdef SYSTEMD_FOUND
  this->journal = stdout_is_journal();
#endif
}

Logger::Logger(const int log_level, const std::string& log_file):
  log_level(log_level),
  ofstream(log_file.data(), std::ios_base::app),
  stream(ofstream.rdbuf()),
  null_buffer{},
  null_stream{&null_buffer}
{
}

int Logger::parse_level(const std::string& value)
{
  const std::string name = utils::tolower(value);
  for (int level = debug_lvl; level <= error_lvl; ++level)
    if (name == utils::tolower(level_names[level]))
      return level;
  const int level = std::atoi(name.data());
  if (level < debug_lvl || level > error_lvl)
    return debug_lvl;
  return level;
}

int Logger::syslog_priority(const int level)
{
  switch (level)
    {
    case error_lvl:
      return LOG_ERR;
    case warning_lvl:
      return LOG_WARNING;
    case info_lvl:
      return LOG_INFO;
    default:
      return LOG_DEBUG;
    }
}

std::unique_ptr<Logger>& Logger::instance()
{
  static std::unique_ptr<Logger> instance;

  if (!instance)
    {
      const std::string log_file = Config::get("log_file", "");
      const int log_level = Logger::parse_level(Config::get("log_level", "0"));
      if (log_file.empty())
        instance = std::make_unique<Logger>(log_level);
      else
        instance = std::make_unique<Logger>(log_level, log_file);
    }
  return instance;
}

std::ostream& Logger::start_entry(const int level, const char* src_file, const int line)
{
  if (level < this->log_level)
    return this->null_stream;
  this->stream << '[' << level_names[level] << "]: " << src_file << ':' << line << ":\t";
  return this->stream;
}
