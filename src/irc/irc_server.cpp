#include <irc/irc_server.hpp>
#include <irc/nick.hpp>

#include <utils/regex_escape.hpp>
#include <utils/template.hpp>
#include <logger/logger.hpp>

namespace
{
  std::optional<std::string> extract(const std::string& str, const RE2& re)
  {
    std::string res;
    if (!RE2::FullMatch(str, re, &res) || res.empty())
      return std::nullopt;
    return res;
  }

  void check_compiled(const RE2& re)
  {
    if (!re.ok())
      log_error("Invalid regex built from a template: ", re.pattern(), ": ", re.error());
    else
      log_debug("Compiled template regex: ", re.pattern());
  }
}

IrcServer::IrcServer(const std::string& domain, const std::string& homeserver_domain,
                     const NameTemplates& templates):
  domain(domain),
  homeserver_domain(homeserver_domain),
  templates(templates),
  user_claim_re(this->template_to_regex(templates.user, placeholder::nick, "(.*)"), utils::regex_options()),
  user_extract_re(this->template_to_regex(templates.user, placeholder::nick, "(.*?)"), utils::regex_options()),
  alias_claim_re(this->template_to_regex(templates.alias, placeholder::channel, "#(.*)"), utils::regex_options()),
  alias_lazy_extract_re(this->template_to_regex(templates.alias, placeholder::channel, "(.*?)"), utils::regex_options()),
  alias_greedy_extract_re(this->template_to_regex(templates.alias, placeholder::channel, "(.*)"), utils::regex_options())
{
  for (const RE2* re: {&this->user_claim_re, &this->user_extract_re, &this->alias_claim_re,
                       &this->alias_lazy_extract_re, &this->alias_greedy_extract_re})
    check_compiled(*re);
}

const std::string& IrcServer::get_domain() const
{
  return this->domain;
}

const std::string& IrcServer::get_homeserver_domain() const
{
  return this->homeserver_domain;
}

const NameTemplates& IrcServer::get_templates() const
{
  return this->templates;
}

bool IrcServer::claims_user_id(const std::string& user_id) const
{
  return RE2::FullMatch(user_id, this->user_claim_re);
}

std::optional<std::string> IrcServer::get_nick_from_user_id(const std::string& user_id) const
{
  return extract(user_id, this->user_extract_re);
}

std::string IrcServer::get_user_id_from_nick(const std::string& nick) const
{
  return this->render(this->templates.user, placeholder::nick, nick) + ":" + this->homeserver_domain;
}

std::string IrcServer::get_display_name_from_nick(const std::string& nick) const
{
  return this->render(this->templates.display_name, placeholder::nick, nick);
}

std::string IrcServer::get_user_localpart(const std::string& nick) const
{
  const std::string user_id = this->render(this->templates.user, placeholder::nick, nick);
  if (user_id.empty())
    return user_id;
  return user_id.substr(1);
}

bool IrcServer::claims_alias(const std::string& alias) const
{
  return RE2::FullMatch(alias, this->alias_claim_re);
}

std::optional<std::string> IrcServer::get_channel_from_alias(const std::string& alias,
                                                             const Capture capture) const
{
  if (capture == Capture::Greedy)
    return extract(alias, this->alias_greedy_extract_re);
  return extract(alias, this->alias_lazy_extract_re);
}

std::string IrcServer::get_alias_from_channel(const std::string& channel) const
{
  return this->render(this->templates.alias, placeholder::channel, channel) + ":" + this->homeserver_domain;
}

std::string IrcServer::get_nick(const std::string& user_id,
                                const std::optional<std::string>& display_name) const
{
  return ::get_nick(user_id, display_name, this->templates.nick);
}

std::string IrcServer::get_user_regex() const
{
  // The nick is unknown, so replace it with a wildcard
  return this->template_to_regex(this->templates.user, placeholder::nick, ".*");
}

std::string IrcServer::get_alias_regex() const
{
  return this->template_to_regex(this->templates.alias, placeholder::channel, ".*");
}

std::string IrcServer::template_to_regex(const std::string& tpl, const std::string& variable,
                                         const std::string& fragment) const
{
  // Only match the user ids and aliases of our own homeserver
  return utils::template_to_regex(tpl, {{placeholder::server, this->domain}},
                                  {{variable, fragment}},
                                  ":" + utils::regex_escape(this->homeserver_domain));
}

std::string IrcServer::render(const std::string& tpl, const std::string& variable,
                              const std::string& value) const
{
  // $SERVER first: the value comes from the network and must never be
  // searched for placeholders
  return utils::render_template(tpl, {{placeholder::server, this->domain},
                                      {variable, value}});
}
