#pragma once


#include <optional>
#include <string>

#include <re2/re2.h>

/**
 * The templates describing how names from one IRC network are
 * translated into Matrix identifiers, and back.
 */
struct NameTemplates
{
  /**
   * Matrix user id of the virtual user representing an IRC nick, without
   * the homeserver part. $SERVER and $NICK.
   */
  std::string user{"@$SERVER_$NICK"};
  /**
   * Matrix display name of that virtual user. $SERVER and $NICK.
   */
  std::string display_name{"$NICK (IRC)"};
  /**
   * IRC nick of a Matrix user. $DISPLAY, $LOCALPART and $USERID.
   */
  std::string nick{"M-$DISPLAY"};
  /**
   * Matrix alias of the room bridged to an IRC channel, without the
   * homeserver part. $SERVER and $CHANNEL.
   */
  std::string alias{"#irc_$SERVER_$CHANNEL"};
};

/**
 * Translates between the names of one IRC network (nicks and channels)
 * and the Matrix identifiers (user ids and aliases) that the bridge
 * owns on its homeserver.
 *
 * All the regexes are compiled once, in the constructor. Every method is
 * const and can be called concurrently from any number of threads.
 */
class IrcServer
{
public:
  /**
   * How the channel name is captured when extracting it from an alias:
   * the shortest or the longest possible match.
   */
  enum class Capture
  {
    Lazy,
    Greedy,
  };

  IrcServer(const std::string& domain, const std::string& homeserver_domain,
            const NameTemplates& templates);
  ~IrcServer() = default;

  IrcServer(const IrcServer&) = delete;
  IrcServer(IrcServer&&) = delete;
  IrcServer& operator=(const IrcServer&) = delete;
  IrcServer& operator=(IrcServer&&) = delete;

  const std::string& get_domain() const;
  const std::string& get_homeserver_domain() const;
  const NameTemplates& get_templates() const;

  /**
   * Whether the given user id is one of the virtual users of this IRC
   * network, on our homeserver.
   */
  bool claims_user_id(const std::string& user_id) const;
  /**
   * Returns the nick encoded in the user id, or nothing if that user id
   * is not one of ours (or if the nick would be empty).
   */
  std::optional<std::string> get_nick_from_user_id(const std::string& user_id) const;
  std::string get_user_id_from_nick(const std::string& nick) const;
  std::string get_display_name_from_nick(const std::string& nick) const;
  /**
   * The user id of that nick, without the leading @ and without the
   * homeserver.
   */
  std::string get_user_localpart(const std::string& nick) const;

  /**
   * Whether the given alias is the alias of a channel of this IRC
   * network, on our homeserver. The channel must start with '#'.
   */
  bool claims_alias(const std::string& alias) const;
  std::optional<std::string> get_channel_from_alias(const std::string& alias,
                                                    const Capture capture=Capture::Lazy) const;
  std::string get_alias_from_channel(const std::string& channel) const;

  std::string get_nick(const std::string& user_id,
                       const std::optional<std::string>& display_name) const;

  /**
   * Regexes matching all the user ids, and all the aliases, of this
   * network. They can be given to the homeserver as our namespaces.
   */
  std::string get_user_regex() const;
  std::string get_alias_regex() const;

private:
  std::string template_to_regex(const std::string& tpl, const std::string& variable,
                                const std::string& fragment) const;
  std::string render(const std::string& tpl, const std::string& variable,
                     const std::string& value) const;

  const std::string domain;
  const std::string homeserver_domain;
  const NameTemplates templates;

  const RE2 user_claim_re;
  const RE2 user_extract_re;
  const RE2 alias_claim_re;
  const RE2 alias_lazy_extract_re;
  const RE2 alias_greedy_extract_re;
};
