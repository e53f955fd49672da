#pragma once

#include <string>

namespace utils
{
  std::string tolower(const std::string& original);
}
