#pragma once


#include <string>
#include <vector>

namespace utils
{
  /**
   * Split on any whitespace character, never returning empty items.
   */
  std::vector<std::string> split_words(const std::string& s);
}
