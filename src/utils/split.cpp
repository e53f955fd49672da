#include <utils/split.hpp>

#include <sstream>

namespace utils
{
  std::vector<std::string> split_words(const std::string& s)
  {
    std::vector<std::string> ret;
    std::istringstream ss(s);
    std::string item;
    while (ss >> item)
      ret.emplace_back(std::move(item));
    return ret;
  }
}
