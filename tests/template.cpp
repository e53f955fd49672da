#include "catch.hpp"

#include <utils/regex_escape.hpp>
#include <utils/template.hpp>

#include <re2/re2.h>

TEST_CASE("Regex escaping")
{
  CHECK(utils::regex_escape("") == "");
  CHECK(utils::regex_escape("freenode") == "freenode");
  CHECK(utils::regex_escape("example.org") == "example\\.org");
  CHECK(utils::regex_escape("$NICK") == "\\$NICK");
  CHECK(utils::regex_escape(".*+?^${}()|[]\\") ==
        "\\.\\*\\+\\?\\^\\$\\{\\}\\(\\)\\|\\[\\]\\\\");
  // Not metacharacters
  CHECK(utils::regex_escape("#irc_-:@!/") == "#irc_-:@!/");

  SECTION("An escaped string matches only itself")
    {
      const std::string text{"a.b*c+(d)|[e]^$\\{f}?"};
      const RE2 re(utils::regex_escape(text));
      REQUIRE(re.ok());
      CHECK(RE2::FullMatch(text, re));
      CHECK_FALSE(RE2::FullMatch("aXb*c+(d)|[e]^$\\{f}?", re));
      CHECK_FALSE(RE2::FullMatch("abbbc", re));
    }
}

TEST_CASE("Placeholder escaping")
{
  // What "$NICK" looks like once the whole template has been escaped
  CHECK(utils::escaped_placeholder("$NICK") == "\\$NICK");
  // And the regex that finds that text
  CHECK(utils::escaped_placeholder_pattern("$NICK") == "\\\\\\$NICK");

  const RE2 re(utils::escaped_placeholder_pattern("$NICK"));
  REQUIRE(re.ok());
  CHECK(RE2::FullMatch(utils::regex_escape("$NICK"), re));
  CHECK_FALSE(RE2::FullMatch("$NICK", re));
}

TEST_CASE("Template rendering")
{
  CHECK(utils::render_template("@$SERVER_$NICK", {{placeholder::server, "freenode"},
                                                  {placeholder::nick, "bob"}}) == "@freenode_bob");
  // Every occurrence is replaced
  CHECK(utils::render_template("$NICK|$NICK", {{placeholder::nick, "bob"}}) == "bob|bob");
  // Values are not escaped, nor searched for other placeholders
  CHECK(utils::render_template("$SERVER/$NICK", {{placeholder::server, "a.b"},
                                                 {placeholder::nick, "$SERVER"}}) == "a.b/$SERVER");
  // Unknown placeholders are left untouched
  CHECK(utils::render_template("$UNKNOWN_$NICK", {{placeholder::nick, "bob"}}) == "$UNKNOWN_bob");
  CHECK(utils::render_template("", {{placeholder::nick, "bob"}}) == "");
}

TEST_CASE("replace_all")
{
  std::string s{"aaa"};
  utils::replace_all(s, "a", "aa");
  CHECK(s == "aaaaaa");
  utils::replace_all(s, "", "b");
  CHECK(s == "aaaaaa");
  utils::replace_all(s, "aa", "");
  CHECK(s.empty());
}

TEST_CASE("Template to regex")
{
  GIVEN("The default user template")
    {
      const std::string regex = utils::template_to_regex("@$SERVER_$NICK",
                                                         {{placeholder::server, "irc.example.net"}},
                                                         {{placeholder::nick, "(.*?)"}},
                                                         ":" + utils::regex_escape("example.org"));
      THEN("the literal values are escaped but not the regex fragments")
        CHECK(regex == "@irc\\.example\\.net_(.*?):example\\.org");
      THEN("it extracts the nick")
        {
          std::string nick;
          CHECK(RE2::FullMatch("@irc.example.net_bob:example.org", RE2(regex), &nick));
          CHECK(nick == "bob");
        }
      THEN("a dot of the domain is not a wildcard")
        {
          CHECK_FALSE(RE2::FullMatch("@ircXexample.net_bob:example.org", RE2(regex)));
          CHECK_FALSE(RE2::FullMatch("@irc.example.net_bob:exampleXorg", RE2(regex)));
        }
    }
  GIVEN("A template full of metacharacters")
    {
      const std::string tpl{"@(irc)+[$SERVER]*$NICK?"};
      const std::string regex = utils::template_to_regex(tpl, {{placeholder::server, "a|b"}},
                                                         {{placeholder::nick, "(.*)"}});
      const RE2 re(regex);
      REQUIRE(re.ok());
      std::string nick;
      CHECK(RE2::FullMatch("@(irc)+[a|b]*bob?", re, &nick));
      CHECK(nick == "bob");
      CHECK_FALSE(RE2::FullMatch("@ircirc[a]bob", re));
      CHECK_FALSE(RE2::FullMatch("@(irc)+[b]*bob?", re));
    }
  GIVEN("A regex fragment containing a backslash")
    {
      const std::string regex = utils::template_to_regex("#$CHANNEL", {},
                                                         {{placeholder::channel, "(\\w+)"}});
      THEN("it is inserted unchanged")
        CHECK(regex == "#(\\w+)");
    }
  GIVEN("A template without the variable")
    {
      const std::string regex = utils::template_to_regex("@static", {}, {{placeholder::nick, "(.*)"}},
                                                         ":hs");
      CHECK(regex == "@static:hs");
    }
}

TEST_CASE("Regex options")
{
  const std::string regex = utils::template_to_regex("#$CHANNEL", {{placeholder::server, "fr\xe9node"}},
                                                     {{placeholder::channel, "(.*)"}}, ":caf\xe9");
  const RE2 re(regex, utils::regex_options());
  REQUIRE(re.ok());
  std::string channel;
  SECTION("Bytes that are not UTF-8 are matched as Latin-1")
    {
      CHECK(RE2::FullMatch("#\xff\xfe:caf\xe9", re, &channel));
      CHECK(channel == "\xff\xfe");
    }
  SECTION("The dot matches newlines")
    {
      CHECK(RE2::FullMatch("#a\nb:caf\xe9", re, &channel));
      CHECK(channel == "a\nb");
    }
  SECTION("An invalid pattern is reported, not printed")
    {
      const RE2 invalid("(", utils::regex_options());
      CHECK_FALSE(invalid.ok());
      CHECK_FALSE(invalid.error().empty());
    }
}
