#pragma once

#include <string>

namespace utils
{
  /**
   * Return a copy of the given text where every regular expression
   * metacharacter (. * + ? ^ $ { } ( ) | [ ] \) is prefixed with a
   * backslash. The result, used in a pattern, matches exactly the original
   * text.
   */
  std::string regex_escape(const std::string& text);
}
