#include <config/network_config.hpp>
#include <bridge/membership_sync.hpp>
#include <irc/irc_server.hpp>
#include <irc/nick.hpp>
#include <config/config.hpp>
#include <logger/logger.hpp>
#include <utils/xdg.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

/**
 * Provide an helpful message to help the user write a minimal working
 * configuration file.
 */
int config_help(const std::string& missing_option)
{
  if (!missing_option.empty())
    log_error("Configuration error: empty value for option ", missing_option, ".");
  log_error("Please provide a configuration file filled like this:\n\n"
            "irc_server=irc.example.net\nhomeserver_domain=example.org");
  return 1;
}

int display_help()
{
  std::cout << "Usage: " PROJECT_NAME " [configuration_file] [user_id|alias|nick...]" << std::endl;
  std::cout << "Check the name templates of the configuration file, then show how\n"
               "each given identifier is translated." << std::endl;
  return 0;
}

static void describe(const IrcServer& server, const MembershipSyncPolicy& policy,
                     const std::string& identifier)
{
  if (identifier[0] == '@')
    {
      const auto nick = server.get_nick_from_user_id(identifier);
      if (server.claims_user_id(identifier) && nick)
        std::cout << identifier << ": virtual user of IRC nick " << *nick << std::endl;
      else
        {
          try {
            const auto irc_nick = server.get_nick(identifier, std::nullopt);
            std::cout << identifier << ": Matrix user, IRC nick " << irc_nick << std::endl;
          } catch (const AllCharactersInvalid& e) {
            std::cout << identifier << ": Matrix user without any valid nick" << std::endl;
            log_warning(e.what());
          }
        }
    }
  else if (identifier[0] == '#' && identifier.find(':') != std::string::npos)
    {
      const auto channel = server.get_channel_from_alias(identifier);
      if (server.claims_alias(identifier) && channel)
        std::cout << identifier << ": alias of IRC channel " << *channel
                  << " (initial member list synced to Matrix: "
                  << std::boolalpha << policy.should_sync_membership_to_matrix(SyncKind::Initial, *channel)
                  << ")" << std::endl;
      else
        std::cout << identifier << ": alias not bridged to " << server.get_domain() << std::endl;
    }
  else
    {
      std::cout << identifier << ": IRC name, user id " << server.get_user_id_from_nick(identifier)
                << ", display name \"" << server.get_display_name_from_nick(identifier)
                << "\", alias " << server.get_alias_from_channel(identifier) << std::endl;
    }
}

int main(int ac, char** av)
{
  if (ac > 1)
    {
      const std::string arg = av[1];
      if (arg.size() >= 2 && arg[0] == '-' && arg[1] == '-')
        {
          if (arg == "--help")
            return display_help();
          else
            {
              std::cerr << "Unknown command line option: " << arg << std::endl;
              return 1;
            }
        }
    }
  const std::string conf_filename = ac > 1 ? av[1] : xdg_config_path(PROJECT_NAME ".cfg");
  std::cout << "Using configuration file: " << conf_filename << std::endl;

  if (!Config::read_conf(conf_filename))
    return config_help("");

  NetworkConfig network;
  try {
    network = load_network_config();
  } catch (const ConfigurationError& e) {
    if (!e.option.empty())
      return config_help(e.option);
    log_error("Configuration error: ", e.what());
    return 1;
  }

  const IrcServer server(network.domain, network.homeserver_domain, network.templates);
  const MembershipSyncPolicy policy(network.membership_lists_enabled, network.membership_rules);

  if (!check_templates(server))
    {
      log_error("The name templates of ", network.domain, " can not be used.");
      return 1;
    }
  log_info("Templates of ", network.domain, " checked. Users: ", server.get_user_regex(),
           ", aliases: ", server.get_alias_regex());

  std::vector<std::string> identifiers(av + std::min(ac, 2), av + ac);
  for (const auto& identifier: identifiers)
    if (!identifier.empty())
      describe(server, policy, identifier);
  return 0;
}
