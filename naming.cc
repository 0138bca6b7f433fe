// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <string>
#include <string_view>

#include "naming.h"
#include "string_util.h"

static constexpr std::string_view NBSP = "\xC2\xA0"; // U+00A0 in UTF-8
static constexpr std::string_view ILLEGAL_PATH_CHARS = "\\/*?:\"<>|";
static constexpr std::string_view ELLIPSIS = "...";

auto safe_name(std::string const& raw) -> std::string
{
  std::string const s = replace_all(raw, std::string{NBSP}, " ");

  std::string ret = "";
  ret.reserve(s.length());

  bool pending_space = false;
  for(char ch : s)
  {
    if(is_space(ch))
    {
      pending_space = true;
      continue;
    }

    if(pending_space and not ret.empty())
      ret += ' ';
    pending_space = false;

    if(ILLEGAL_PATH_CHARS.find(ch) != std::string_view::npos)
      ret += '_';
    else
      ret += ch;
  }

  if(ret.empty())
    return std::string{UNKNOWN_NAME};

  // "." and ".." would point to the current or parent directory.
  if(ret.find_first_not_of('.') == std::string::npos)
    return std::string(ret.length(), '_');

  return ret;
}

auto truncate_with_ellipsis(std::string const& stem, size_t limit) -> std::string
{
  if(utf8_length(stem) <= limit)
    return stem;

  size_t const keep = limit > ELLIPSIS.length() ? limit - ELLIPSIS.length() : 1;
  return rtrim(utf8_prefix(stem, keep)) + std::string{ELLIPSIS};
}
