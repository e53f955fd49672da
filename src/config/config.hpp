/**
 * Read the config file and save all the values in a map.
 * Also, a singleton.
 *
 * Use Config::read_conf("bla") to read the file you want to use. Each
 * non-empty line not starting with '#' is an "option=value" pair, spaces
 * around the option and the value are ignored. The environment variables
 * named PASSERELLE_<OPTION> override the values read from the file.
 *
 * Config::get() can then be used to access the values in the conf.
 */

#pragma once

#include <vector>
#include <string>
#include <map>

class Config
{
public:
  Config() = default;
  ~Config() = default;
  Config(const Config&) = delete;
  Config& operator=(const Config&) = delete;
  Config(Config&&) = delete;
  Config& operator=(Config&&) = delete;

  /**
   * returns a value from the config. If it doesn’t exist, use
   * the second argument as the default.
   */
  static std::string get(const std::string&, const std::string&);
  /**
   * returns a value from the config. If it doesn’t exist, use
   * the second argument as the default.
   */
  static bool get_bool(const std::string&, const bool);
  /**
   * returns the whitespace-separated items of the value, in order. An
   * absent option is an empty list.
   */
  static std::vector<std::string> get_list(const std::string&);
  /**
   * Set a value for the given option, in memory only.
   */
  static void set(const std::string&, const std::string&);
  /**
   * Remove all the values.
   */
  static void clear();
  /**
   * Replace all the values with the ones read from the file at the given
   * path, then from the environment. Returns false, and keeps the
   * previous values, if the file can not be opened.
   */
  static bool read_conf(const std::string& filename);

private:
  /**
   * Store the option=value pair found on the given line, if any. For
   * lines coming from the environment, only the options with our prefix
   * are kept.
   */
  static void parse_line(const std::string& line, const bool from_env);

  static std::map<std::string, std::string> values;
};
