#include <irc/nick.hpp>

#include <utils/get_first_non_empty.hpp>
#include <utils/template.hpp>

#include <algorithm>
#include <iterator>
#include <cstring>

AllCharactersInvalid::AllCharactersInvalid(const std::string& user_id):
  std::runtime_error("Could not get nick for user " + user_id + ", all characters were invalid")
{
}

bool is_valid_nick_char(const char c)
{
  if ((c >= 'a' && c <= 'z') ||
      (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9'))
    return true;
  return c != '\0' && std::strchr("[]^\\{}-`_|", c) != nullptr;
}

std::string remove_invalid_nick_chars(const std::string& original)
{
  std::string res;
  res.reserve(original.size());
  std::copy_if(original.begin(), original.end(), std::back_inserter(res), is_valid_nick_char);
  return res;
}

std::string get_user_id_localpart(const std::string& user_id)
{
  if (user_id.empty())
    return {};
  const std::string without_sigil = user_id.substr(1);
  return without_sigil.substr(0, without_sigil.find(':'));
}

std::string get_nick(const std::string& user_id,
                     const std::optional<std::string>& display_name,
                     const std::string& nick_template)
{
  std::string localpart = remove_invalid_nick_chars(get_user_id_localpart(user_id));
  std::string display;
  if (display_name)
    display = remove_invalid_nick_chars(*display_name);

  const std::string& chosen = get_first_non_empty(display, localpart);
  if (chosen.empty())
    throw AllCharactersInvalid(user_id);

  return utils::render_template(nick_template, {
      {placeholder::user_id, user_id},
      {placeholder::localpart, localpart},
      {placeholder::display, chosen},
    });
}
