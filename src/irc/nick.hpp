#pragma once

#include <optional>
#include <stdexcept>
#include <string>

/**
 * Raised when no valid IRC nickname can be derived from a Matrix user:
 * both the display name and the localpart are made only of characters
 * that are not allowed in a nick.
 */
struct AllCharactersInvalid: public std::runtime_error
{
  explicit AllCharactersInvalid(const std::string& user_id);
};

/**
 * Letters, digits and []^\{}-`_|
 * Everything else, including any byte of a non-ascii character, can not
 * be part of an IRC nickname.
 */
bool is_valid_nick_char(const char c);

std::string remove_invalid_nick_chars(const std::string& original);

/**
 * "@foo:example.org" -> "foo"
 */
std::string get_user_id_localpart(const std::string& user_id);

/**
 * Build the IRC nickname used for the given Matrix user, from the nick
 * template ($DISPLAY, $LOCALPART and $USERID placeholders).
 *
 * $DISPLAY is the display name with its invalid characters removed or, if
 * that leaves nothing (or if there is no display name), the localpart of
 * the user id with its invalid characters removed.
 *
 * Throws AllCharactersInvalid if both are empty.
 */
std::string get_nick(const std::string& user_id,
                     const std::optional<std::string>& display_name,
                     const std::string& nick_template);
