// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <string>
#include <vector>

enum class match_mode_t
{
  substring,   // keyword anywhere in the name
  whole_word,  // keyword not surrounded by word characters
};

struct keyword_t
{
  std::string key;       // fold_case()d, identifies the aggregate
  std::string original;  // first seen spelling, names the aggregate file
};

//! Trim, drop empty ones and remove case-insensitive duplicates (the first one wins).
//! The order of the remaining keywords is kept.
auto normalize_keywords(std::vector<std::string> const& raw) -> std::vector<keyword_t>;

//! Word characters are ASCII letters and digits, '_' and all non-ASCII characters.
bool is_word_char(char ch);

//! Case-insensitive match of a single keyword, both sides are fold_case()d.
bool matches_keyword(std::string const& channel_name, keyword_t const& keyword, match_mode_t mode);

//! Keys of all matching keywords in keyword order.
auto match_keywords(std::string const& channel_name, std::vector<keyword_t> const& keywords, match_mode_t mode)
  -> std::vector<std::string>;
