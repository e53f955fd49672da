#include "catch.hpp"

#include <utils/tolower.hpp>
#include <utils/split.hpp>
#include <utils/xdg.hpp>
#include <utils/get_first_non_empty.hpp>

#include <cstdlib>

using namespace std::string_literals;

TEST_CASE("Split words")
{
  auto words = utils::split_words("  #foo:initial:true\t#bar:incremental:false  ");
  REQUIRE(words.size() == 2);
  CHECK(words[0] == "#foo:initial:true");
  CHECK(words[1] == "#bar:incremental:false");
  CHECK(utils::split_words("").empty());
  CHECK(utils::split_words("   ").empty());
}

TEST_CASE("tolower")
{
  const std::string lowercase = utils::tolower("CoUcOu LeS CoPaiNs ♥");
  CHECK(lowercase == "coucou les copains ♥");
  CHECK(utils::tolower("LOG_LEVEL") == "log_level");
}

TEST_CASE("get_first_non_empty")
{
  std::string empty;
  std::string display{"display"};
  std::string localpart{"localpart"};
  CHECK(get_first_non_empty(display, localpart) == "display");
  CHECK(get_first_non_empty(empty, localpart) == "localpart");
  CHECK(get_first_non_empty(empty, empty).empty());
}

TEST_CASE("xdg_config_path")
{
  ::unsetenv("XDG_CONFIG_HOME");
  ::unsetenv("HOME");
  std::string res;

  SECTION("Without XDG_CONFIG_HOME nor HOME")
    {
      res = xdg_config_path("coucou.txt");
      CHECK(res == "coucou.txt");
    }
  SECTION("With only HOME")
    {
      ::setenv("HOME", "/home/user", 1);
      res = xdg_config_path("coucou.txt");
      CHECK(res == "/home/user/.config/passerelle/coucou.txt");
    }
  SECTION("With only XDG_CONFIG_HOME")
    {
      ::setenv("XDG_CONFIG_HOME", "/some_weird_dir", 1);
      res = xdg_config_path("coucou.txt");
      CHECK(res == "/some_weird_dir/passerelle/coucou.txt");
    }
  SECTION("With a relative XDG_CONFIG_HOME")
    {
      ::setenv("XDG_CONFIG_HOME", "relative", 1);
      ::setenv("HOME", "/home/user", 1);
      res = xdg_config_path("coucou.txt");
      CHECK(res == "/home/user/.config/passerelle/coucou.txt");
    }
}
