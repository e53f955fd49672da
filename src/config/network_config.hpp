#pragma once

#include <irc/irc_server.hpp>
#include <bridge/membership_sync.hpp>

#include <stdexcept>
#include <string>
#include <vector>

/**
 * A missing or invalid value in the configuration. option is the name of
 * the faulty option, if any.
 */
struct ConfigurationError: public std::runtime_error
{
  ConfigurationError(const std::string& option, const std::string& message);

  const std::string option;
};

/**
 * Everything the bridge needs to know about the IRC network it serves,
 * read from the Config values.
 */
struct NetworkConfig
{
  std::string domain;
  std::string homeserver_domain;
  NameTemplates templates;

  std::string group_id;
  bool group_id_valid{false};

  bool membership_lists_enabled{false};
  /**
   * The Global rules first, then the room rules, then the channel rules,
   * each kept in the configured order.
   */
  std::vector<SyncRule> membership_rules;

  bool groups_enabled() const;
};

/**
 * Build the NetworkConfig from the values currently in Config. Throws a
 * ConfigurationError if a required option is missing, or if a membership
 * rule can not be parsed.
 */
NetworkConfig load_network_config();

/**
 * Parse "<entity>:<kind>:<true|false>" entries. The entity can itself
 * contain ':' (room ids do), the entry is split from the right.
 */
std::vector<SyncRule> parse_membership_rules(const std::vector<std::string>& entries,
                                             const SyncRule::Scope scope);

/**
 * Whether the given string looks like a Matrix group id: +name:server
 */
bool is_valid_group_id(const std::string& group_id);

/**
 * Render some synthetic names with the templates of the server, then
 * parse them back and check that we get the same names. Each failure is
 * logged. Returns false if any check failed: the templates can not be
 * used.
 */
bool check_templates(const IrcServer& server);
