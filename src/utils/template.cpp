#include <utils/template.hpp>
#include <utils/regex_escape.hpp>

namespace
{
  /**
   * RE2 rewrite strings give a meaning to backslashes (\0 to \9 are
   * references to the captured groups), so the regex fragments must have
   * their backslashes doubled to be inserted as-is.
   */
  std::string literal_rewrite(const std::string& fragment)
  {
    std::string res;
    res.reserve(fragment.size());
    for (const char c: fragment)
      {
        if (c == '\\')
          res += '\\';
        res += c;
      }
    return res;
  }
}

namespace utils
{
  const RE2::Options& regex_options()
  {
    static const RE2::Options options = []()
      {
        RE2::Options res;
        res.set_encoding(RE2::Options::EncodingLatin1);
        res.set_dot_nl(true);
        res.set_log_errors(false);
        return res;
      }();
    return options;
  }

  void replace_all(std::string& str, const std::string& from, const std::string& to)
  {
    if (from.empty())
      return;
    std::string::size_type pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos)
      {
        str.replace(pos, from.size(), to);
        pos += to.size();
      }
  }

  std::string render_template(const std::string& tpl, const TemplateVars& literal_vars)
  {
    std::string res(tpl);
    for (const auto& var: literal_vars)
      replace_all(res, var.first, var.second);
    return res;
  }

  std::string escaped_placeholder(const std::string& placeholder)
  {
    return regex_escape(placeholder);
  }

  std::string escaped_placeholder_pattern(const std::string& placeholder)
  {
    return regex_escape(escaped_placeholder(placeholder));
  }

  std::string template_to_regex(const std::string& tpl,
                                const TemplateVars& literal_vars,
                                const TemplateVars& regex_vars,
                                const std::string& suffix)
  {
    // At this point the template is still a literal string
    std::string regex = render_template(tpl, literal_vars);
    regex = regex_escape(regex);
    for (const auto& var: regex_vars)
      {
        if (var.first.empty())
          continue;
        const RE2 placeholder_re(escaped_placeholder_pattern(var.first), regex_options());
        RE2::GlobalReplace(&regex, placeholder_re, literal_rewrite(var.second));
      }
    return regex + suffix;
  }
}
