// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <algorithm> // std::ranges::any_of
#include <cassert>
#include <cctype>    // std::isalnum

#include "keywords.h"
#include "string_util.h"

auto normalize_keywords(std::vector<std::string> const& raw) -> std::vector<keyword_t>
{
  std::vector<keyword_t> ret = {};

  for(auto const& keyword : raw)
  {
    std::string const original = trim(keyword);
    if(original.empty())
      continue;

    std::string const key = fold_case(original);
    bool const seen = std::ranges::any_of(ret, [&key](keyword_t const& k) { return k.key == key; });
    if(not seen)
      ret.push_back(keyword_t{key, original});
  }

  return ret;
}

bool is_word_char(char ch)
{
  auto const c = static_cast<unsigned char>(ch);
  return c >= 0x80 or std::isalnum(c) or c == '_';
}

namespace
{
  bool matches_whole_word(std::string const& name, std::string const& key)
  {
    for(size_t pos = name.find(key); pos != std::string::npos; pos = name.find(key, pos+1))
    {
      size_t const end = pos + key.length();

      bool const left_bounded  = pos == 0 or not is_word_char(name[pos-1]);
      bool const right_bounded = end == name.length() or not is_word_char(name[end]);

      if(left_bounded and right_bounded)
        return true;
    }

    return false;
  }
} // namespace

bool matches_keyword(std::string const& channel_name, keyword_t const& keyword, match_mode_t mode)
{
  assert(not keyword.key.empty());

  std::string const name = fold_case(channel_name);

  switch(mode)
  {
    case match_mode_t::substring:
      return name.contains(keyword.key);

    case match_mode_t::whole_word:
      return matches_whole_word(name, keyword.key);
  }

  return false;
}

auto match_keywords(std::string const& channel_name, std::vector<keyword_t> const& keywords, match_mode_t mode)
  -> std::vector<std::string>
{
  std::vector<std::string> ret = {};

  for(auto const& keyword : keywords)
  {
    if(matches_keyword(channel_name, keyword, mode))
      ret.push_back(keyword.key);
  }

  return ret;
}
