#include <config/network_config.hpp>
#include <config/config.hpp>
#include <logger/logger.hpp>
#include <irc/nick.hpp>
#include <utils/template.hpp>

#include <re2/re2.h>

using namespace std::string_literals;

ConfigurationError::ConfigurationError(const std::string& option, const std::string& message):
  std::runtime_error(option.empty() ? message : option + ": " + message),
  option(option)
{
}

bool NetworkConfig::groups_enabled() const
{
  return this->group_id_valid;
}

namespace
{
  std::string get_required(const std::string& option)
  {
    const std::string value = Config::get(option, "");
    if (value.empty())
      throw ConfigurationError(option, "empty value");
    return value;
  }

  bool parse_bool(const std::string& value, const std::string& entry)
  {
    if (value == "true")
      return true;
    if (value == "false")
      return false;
    throw ConfigurationError("", "invalid value \""s + value + "\" in membership rule " + entry);
  }
}

std::vector<SyncRule> parse_membership_rules(const std::vector<std::string>& entries,
                                             const SyncRule::Scope scope)
{
  std::vector<SyncRule> res;
  for (const auto& entry: entries)
    {
      const auto value_sep = entry.rfind(':');
      if (value_sep == std::string::npos || value_sep == 0)
        throw ConfigurationError("", "invalid membership rule " + entry);
      const auto kind_sep = entry.rfind(':', value_sep - 1);
      if (kind_sep == std::string::npos || kind_sep == 0)
        throw ConfigurationError("", "invalid membership rule " + entry);

      const std::string entity = entry.substr(0, kind_sep);
      const std::string kind_name = entry.substr(kind_sep + 1, value_sep - kind_sep - 1);
      const bool enabled = parse_bool(entry.substr(value_sep + 1), entry);

      SyncKind kind;
      try {
        kind = sync_kind_from_string(kind_name);
      } catch (const InvalidKind& e) {
        throw ConfigurationError("", e.what() + " in membership rule "s + entry);
      }

      if (scope == SyncRule::Scope::Room)
        res.push_back(SyncRule::room(entity, kind, enabled));
      else if (scope == SyncRule::Scope::Channel)
        res.push_back(SyncRule::channel(entity, kind, enabled));
      else
        throw ConfigurationError("", "membership rule " + entry + " must target a room or a channel");
    }
  return res;
}

bool is_valid_group_id(const std::string& group_id)
{
  static const RE2 group_id_re(R"(\+\S+:\S+)", utils::regex_options());
  return RE2::FullMatch(group_id, group_id_re);
}

NetworkConfig load_network_config()
{
  NetworkConfig res;
  res.domain = get_required("irc_server");
  res.homeserver_domain = get_required("homeserver_domain");

  const NameTemplates defaults{};
  res.templates.user = Config::get("user_template", defaults.user);
  res.templates.display_name = Config::get("display_name_template", defaults.display_name);
  res.templates.nick = Config::get("nick_template", defaults.nick);
  res.templates.alias = Config::get("alias_template", defaults.alias);

  res.group_id = Config::get("group_id", "");
  if (!res.group_id.empty())
    {
      res.group_id_valid = is_valid_group_id(res.group_id);
      if (!res.group_id_valid)
        log_warning(res.domain, " has an incorrectly configured group_id (", res.group_id,
                    ") and will not set groups.");
    }

  res.membership_lists_enabled = Config::get_bool("membership_lists_enabled", false);

  for (const auto direction: {SyncDirection::IrcToMatrix, SyncDirection::MatrixToIrc})
    for (const auto kind: {SyncKind::Initial, SyncKind::Incremental})
      {
        const std::string option = "membership_lists_"s +
          (direction == SyncDirection::IrcToMatrix ? "irc_to_matrix_" : "matrix_to_irc_") +
          to_string(kind);
        res.membership_rules.push_back(SyncRule::global(direction, kind,
                                                        Config::get_bool(option, false)));
      }

  for (const auto& rule: parse_membership_rules(Config::get_list("membership_lists_rooms"),
                                                SyncRule::Scope::Room))
    res.membership_rules.push_back(rule);
  for (const auto& rule: parse_membership_rules(Config::get_list("membership_lists_channels"),
                                                SyncRule::Scope::Channel))
    res.membership_rules.push_back(rule);

  log_debug("Loaded configuration for ", res.domain, " on ", res.homeserver_domain, ", ",
            res.membership_rules.size(), " membership rules");
  return res;
}

bool check_templates(const IrcServer& server)
{
  static const std::string nick{"passerelle_check"};
  static const std::string channel{"#passerelle-check"};
  bool res = true;

  const auto user_id = server.get_user_id_from_nick(nick);
  if (!server.claims_user_id(user_id))
    {
      log_error("user_template: the user id ", user_id, " is not recognized as ours");
      res = false;
    }
  const auto extracted_nick = server.get_nick_from_user_id(user_id);
  if (!extracted_nick || *extracted_nick != nick)
    {
      log_error("user_template: could not find the nick ", nick, " back in ", user_id);
      res = false;
    }
  if (server.claims_user_id(user_id + ".invalid"))
    {
      log_error("user_template: the user id ", user_id, ".invalid, from another homeserver, is recognized as ours");
      res = false;
    }

  const auto alias = server.get_alias_from_channel(channel);
  if (!server.claims_alias(alias))
    {
      log_error("alias_template: the alias ", alias, " is not recognized as ours");
      res = false;
    }
  const auto extracted_channel = server.get_channel_from_alias(alias);
  if (!extracted_channel || *extracted_channel != channel)
    {
      log_error("alias_template: could not find the channel ", channel, " back in ", alias);
      res = false;
    }

  try {
    const auto irc_nick = server.get_nick("@" + nick + ":" + server.get_homeserver_domain(), std::nullopt);
    if (irc_nick.empty())
      {
        log_error("nick_template: the nick template gives empty nicks");
        res = false;
      }
  } catch (const AllCharactersInvalid& e) {
    log_error("nick_template: ", e.what());
    res = false;
  }
  return res;
}
