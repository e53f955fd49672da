#include <utils/regex_escape.hpp>

#include <cstring>

namespace utils
{
  static constexpr char metacharacters[] = ".*+?^${}()|[]\\";

  std::string regex_escape(const std::string& text)
  {
    std::string res;
    res.reserve(text.size() * 2);
    for (const char c: text)
      {
        if (c != '\0' && std::strchr(metacharacters, c) != nullptr)
          res += '\\';
        res += c;
      }
    return res;
  }
}
