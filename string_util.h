// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once

#include <algorithm> // std::find_if
#include <cctype>    // std::isspace, std::tolower
#include <locale>    // std::ctype<wchar_t>
#include <stdexcept> // std::runtime_error
#include <string>
#include <utility>
#include <vector>

inline bool is_space(char ch)
{
  return std::isspace(static_cast<unsigned char>(ch));
}

/**
 * Trim a string left and right.
 */
static inline std::string trim(std::string s)
{
  // left trim
  std::string::iterator space_end =
      std::find_if(s.begin(), s.end(), [](char ch) { return not is_space(ch); });
  s.erase(s.begin(), space_end);

  // right trim
  std::string::iterator space_begin =
    std::find_if(s.rbegin(), s.rend(), [](char ch) { return not is_space(ch); }).base();
  s.erase(space_begin, s.end());

  return s;
}

static inline std::string rtrim(std::string s)
{
  std::string::iterator space_begin =
    std::find_if(s.rbegin(), s.rend(), [](char ch) { return not is_space(ch); }).base();
  s.erase(space_begin, s.end());

  return s;
}

static inline std::string replace_all(std::string s, std::string const& from, std::string const& to)
{
  if(from.empty())
    return s;

  size_t pos = s.find(from);
  while(pos != std::string::npos)
  {
    s.replace(pos, from.length(), to);
    pos = s.find(from, pos + to.length());
  }

  return s;
}

/**
 * Split a text into lines.
 *
 * "\n", "\r\n" and "\r" end a line. The line ends are not part of the lines
 * and a line end at the end of the text doesn't produce an empty last line.
 */
static inline auto split_lines(std::string const& text) -> std::vector<std::string>
{
  std::vector<std::string> ret = {};

  size_t prev = 0;
  for(size_t pos = 0; pos < text.length(); pos++)
  {
    if(text[pos] != '\n' and text[pos] != '\r')
      continue;

    ret.push_back(text.substr(prev, pos - prev));

    if(text[pos] == '\r' and pos+1 < text.length() and text[pos+1] == '\n')
      pos++;
    prev = pos+1;
  }

  if(prev < text.length())
    ret.push_back(text.substr(prev));

  return ret;
}

// ---

//! True for bytes that continue a UTF-8 sequence (10xxxxxx).
inline bool is_utf8_continuation(char ch)
{
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

//! Number of code points in an UTF-8 string.
static inline size_t utf8_length(std::string const& s)
{
  return std::count_if(s.begin(), s.end(), [](char ch) { return not is_utf8_continuation(ch); });
}

//! The first n code points of an UTF-8 string.
static inline std::string utf8_prefix(std::string const& s, size_t n)
{
  size_t count = 0;
  for(size_t pos = 0; pos < s.length(); pos++)
  {
    if(is_utf8_continuation(s[pos]))
      continue;

    if(count == n)
      return s.substr(0, pos);
    count++;
  }

  return s;
}

//! Decode the code point starting at s[pos].
//! Returns the code point and the length of its sequence, the length is 0 for an invalid sequence.
static inline auto utf8_decode(std::string const& s, size_t pos) -> std::pair<char32_t, size_t>
{
  auto const c0 = static_cast<unsigned char>(s[pos]);
  if(c0 < 0x80)
    return {c0, 1};

  size_t len = 0;
  char32_t cp = 0;
  if((c0 & 0xE0) == 0xC0)      { len = 2; cp = c0 & 0x1F; }
  else if((c0 & 0xF0) == 0xE0) { len = 3; cp = c0 & 0x0F; }
  else if((c0 & 0xF8) == 0xF0) { len = 4; cp = c0 & 0x07; }
  else
    return {c0, 0};

  if(pos + len > s.length())
    return {c0, 0};

  for(size_t i = 1; i < len; i++)
  {
    if(not is_utf8_continuation(s[pos+i]))
      return {c0, 0};
    cp = (cp << 6) | (static_cast<unsigned char>(s[pos+i]) & 0x3F);
  }

  return {cp, len};
}

static inline void utf8_append(std::string& s, char32_t cp)
{
  if(cp < 0x80)
    s += static_cast<char>(cp);
  else if(cp < 0x800)
  {
    s += static_cast<char>(0xC0 | (cp >> 6));
    s += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else if(cp < 0x10000)
  {
    s += static_cast<char>(0xE0 | (cp >> 12));
    s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    s += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else
  {
    s += static_cast<char>(0xF0 | (cp >> 18));
    s += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    s += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

/**
 * Locale with Unicode case mappings for wchar_t.
 * glibc always has C.UTF-8 built in (since 2.35), the others are for older systems.
 * Without any of them only ASCII is case folded.
 */
inline auto case_mapping_locale() -> std::locale const&
{
  static std::locale const loc = []()
  {
    for(char const* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"})
    {
      try
      {
        return std::locale{name};
      }
      catch(std::runtime_error const&)
      {
        // not installed, try the next one
      }
    }
    return std::locale::classic();
  }();

  return loc;
}

/**
 * Lowercase an UTF-8 string code point by code point (like towlower()).
 * Invalid UTF-8 bytes are kept as they are.
 */
static inline std::string fold_case(std::string const& s)
{
  auto const& ctype = std::use_facet<std::ctype<wchar_t>>(case_mapping_locale());

  std::string ret = "";
  ret.reserve(s.length());

  size_t pos = 0;
  while(pos < s.length())
  {
    auto const [cp, len] = utf8_decode(s, pos);
    if(len == 0) // invalid, copy the byte
    {
      ret += s[pos];
      pos++;
      continue;
    }

    if(cp < 0x80)
      ret += static_cast<char>(std::tolower(static_cast<int>(cp)));
    else
      utf8_append(ret, static_cast<char32_t>(ctype.tolower(static_cast<wchar_t>(cp))));
    pos += len;
  }

  return ret;
}
