#pragma once

/**
 * Templates are user-provided strings (from the configuration file) like
 * "@$SERVER_$NICK" or "#irc_$SERVER_$CHANNEL", where some placeholders
 * must be replaced by a value.
 *
 * They are used in both directions:
 * - render_template() replaces each placeholder with a literal value, to
 *   build an identifier from a nick or a channel name.
 * - template_to_regex() builds a regex that matches any identifier
 *   produced by the template, with some placeholders replaced by a
 *   literal value and some others by a regex fragment (for example a
 *   capturing group, to extract a nick from a user id).
 */

#include <string>
#include <utility>
#include <vector>

#include <re2/re2.h>

namespace placeholder
{
  static constexpr auto server = "$SERVER";
  static constexpr auto nick = "$NICK";
  static constexpr auto channel = "$CHANNEL";
  static constexpr auto display = "$DISPLAY";
  static constexpr auto user_id = "$USERID";
  static constexpr auto localpart = "$LOCALPART";
}

/**
 * A list of (placeholder, value) pairs, applied in order.
 */
using TemplateVars = std::vector<std::pair<std::string, std::string>>;

namespace utils
{
  /**
   * The options every pattern built from a template is compiled with.
   * Names are arbitrary bytes (IRC has no encoding), so the patterns and
   * the matched strings are read as Latin-1, and '.' matches newlines
   * too. Compilation errors are reported by the caller, not by RE2.
   */
  const RE2::Options& regex_options();

  /**
   * Replace all occurrences of from by to, in place. Replaced text is
   * never searched again.
   */
  void replace_all(std::string& str, const std::string& from, const std::string& to);

  std::string render_template(const std::string& tpl, const TemplateVars& literal_vars);

  /**
   * Return the placeholder as it appears in a template that has already
   * been escaped once with regex_escape(). "$NICK" becomes "\$NICK".
   */
  std::string escaped_placeholder(const std::string& placeholder);
  /**
   * A regex matching the escaped_placeholder() text literally. The
   * placeholder is thus escaped twice: "$NICK" becomes "\\\$NICK".
   */
  std::string escaped_placeholder_pattern(const std::string& placeholder);

  /**
   * The literal_vars are substituted first, with their raw values. The
   * whole string is then escaped, and only after that the regex_vars are
   * substituted with their raw regex fragment. The suffix is appended
   * as-is, it must already be escaped by the caller if needed.
   */
  std::string template_to_regex(const std::string& tpl,
                                const TemplateVars& literal_vars,
                                const TemplateVars& regex_vars,
                                const std::string& suffix = "");
}
