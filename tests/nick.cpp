#include "catch.hpp"

#include <irc/nick.hpp>

TEST_CASE("Nick characters")
{
  for (const char c: std::string{"azAZ09[]^\\{}-`_|"})
    CHECK(is_valid_nick_char(c));
  for (const char c: std::string{" .:@!#$%&*()+=~'\",;<>/?\t"})
    CHECK_FALSE(is_valid_nick_char(c));
  CHECK_FALSE(is_valid_nick_char('\0'));
  CHECK_FALSE(is_valid_nick_char('\xc3'));

  CHECK(remove_invalid_nick_chars("Jean-Édouard (away)") == "Jean-douardaway");
  CHECK(remove_invalid_nick_chars("...") == "");
}

TEST_CASE("User id localpart")
{
  CHECK(get_user_id_localpart("@alice:example.org") == "alice");
  CHECK(get_user_id_localpart("@alice:example.org:8448") == "alice");
  CHECK(get_user_id_localpart("@alice") == "alice");
  CHECK(get_user_id_localpart("@") == "");
  CHECK(get_user_id_localpart("") == "");
}

TEST_CASE("Nick derivation")
{
  const std::string tpl{"M-$DISPLAY"};

  GIVEN("A display name with some valid characters")
    {
      THEN("it is used, without its invalid characters")
        CHECK(get_nick("@alice:example.org", std::string{"Alice Liddell"}, tpl) == "M-AliceLiddell");
    }
  GIVEN("A display name without any valid character")
    {
      THEN("the localpart is used instead")
        CHECK(get_nick("@alice:example.org", std::string{"ア リ ス"}, tpl) == "M-alice");
    }
  GIVEN("An empty display name")
    {
      THEN("it is the same as no display name")
        CHECK(get_nick("@alice.l:example.org", std::string{}, tpl) ==
              get_nick("@alice.l:example.org", std::nullopt, tpl));
      CHECK(get_nick("@alice.l:example.org", std::nullopt, tpl) == "M-alicel");
    }
  GIVEN("A localpart without any valid character")
    {
      THEN("the display name can still be used")
        CHECK(get_nick("@....:example.org", std::string{"Dots"}, tpl) == "M-Dots");
      THEN("nothing can be done without a display name")
        {
          CHECK_THROWS_AS(get_nick("@....:example.org", std::nullopt, tpl), AllCharactersInvalid);
          CHECK_THROWS_AS(get_nick("@....:example.org", std::string{"..."}, tpl), AllCharactersInvalid);
          CHECK_THROWS_WITH(get_nick("@=.=:example.org", std::nullopt, tpl),
                            "Could not get nick for user @=.=:example.org, all characters were invalid");
        }
    }
}

TEST_CASE("Nick templates")
{
  const std::string user_id{"@alice.l:example.org"};
  CHECK(get_nick(user_id, std::string{"Alice"}, "$LOCALPART[m]") == "alicel[m]");
  CHECK(get_nick(user_id, std::string{"Alice"}, "$DISPLAY|$LOCALPART") == "Alice|alicel");
  // The raw user id, not sanitized
  CHECK(get_nick(user_id, std::nullopt, "<$USERID>") == "<@alice.l:example.org>");
  CHECK(get_nick(user_id, std::nullopt, "static") == "static");
}
