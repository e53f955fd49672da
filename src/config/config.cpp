#include <config/config.hpp>
#include <utils/tolower.hpp>
#include <utils/split.hpp>

#include <fstream>
#include <iostream>
#include <cstring>
#include <cerrno>

using namespace std::string_literals;

extern char** environ;

std::map<std::string, std::string> Config::values{};

static const auto env_option_prefix = "PASSERELLE_"s;

static std::string trim(const std::string& str)
{
  static const char* blanks = " \t\r";
  const auto start = str.find_first_not_of(blanks);
  if (start == std::string::npos)
    return {};
  const auto end = str.find_last_not_of(blanks);
  return str.substr(start, end - start + 1);
}

std::string Config::get(const std::string& option, const std::string& def)
{
  auto it = Config::values.find(option);

  if (it == Config::values.end())
    return def;
  return it->second;
}

bool Config::get_bool(const std::string& option, const bool def)
{
  auto res = Config::get(option, "");
  if (res.empty())
    return def;
  return res == "true" || res == "1";
}

std::vector<std::string> Config::get_list(const std::string& option)
{
  return utils::split_words(Config::get(option, ""));
}

void Config::set(const std::string& option, const std::string& value)
{
  Config::values[option] = value;
}

void Config::clear()
{
  Config::values.clear();
}

void Config::parse_line(const std::string& line, const bool from_env)
{
  if (line.empty() || line[0] == '#')
    return;
  const auto pos = line.find('=');
  if (pos == std::string::npos)
    return;
  std::string option = trim(line.substr(0, pos));
  if (from_env)
    {
      if (option.compare(0, env_option_prefix.size(), env_option_prefix) != 0)
        return;
      option = utils::tolower(option.substr(env_option_prefix.size()));
    }
  if (option.empty())
    return;
  Config::values[option] = trim(line.substr(pos + 1));
}

bool Config::read_conf(const std::string& filename)
{
  std::ifstream file(filename.data());
  if (!file.is_open())
    {
      std::cerr << "Error while opening file " << filename << " for reading: " << strerror(errno) << std::endl;
      return false;
    }

  Config::clear();

  std::string line;
  while (std::getline(file, line))
    Config::parse_line(line, false);

  for (char** env_line = environ; *env_line; ++env_line)
    Config::parse_line(*env_line, true);
  return true;
}
