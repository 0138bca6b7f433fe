// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "keywords.h"
#include "m3u.h"
#include "paths.h"

struct unpack_options_t
{
  std::filesystem::path base_dir;
  std::vector<std::string> keywords = {};
  match_mode_t match_mode = match_mode_t::substring;
  bool flat = false;  // never put the entries into ENTRY_SUBDIR
  path_limits_t limits = {};
};

enum class warning_kind_t
{
  unnamed_entry,
  write_failed,
};

struct unpack_warning_t
{
  warning_kind_t kind;
  std::string message;
  std::filesystem::path path = {};
};

struct unpack_results_t
{
  std::vector<std::filesystem::path> written_files = {};
  std::vector<unpack_warning_t> warnings = {};
};

/**
 * Writes every named entry into its own file and collects the entries
 * matching the keywords. flush() writes the collected keyword files.
 *
 * Failing writes don't stop the routing, they end up in results().warnings.
 */
class output_router_t
{
public:

  explicit output_router_t(unpack_options_t const& options);

  output_router_t(output_router_t const&) = delete;
  auto operator=(output_router_t const&) -> output_router_t& = delete;

  void route(entry_t const& entry);

  //! Write the keyword files. Only the first call writes anything.
  void flush();

  //! Whether the entries go into ENTRY_SUBDIR.
  inline bool use_subdir() const { return not m_keywords.empty() and not m_options.flat; }

  inline auto keywords() const -> std::vector<keyword_t> const& { return m_keywords; }
  inline auto results() const -> unpack_results_t const& { return m_results; }

  //! How often the name was routed so far.
  auto occurrences(std::string const& channel_name) const -> int;

private:

  void write_entry(entry_t const& entry, int seq);
  void warn(warning_kind_t kind, std::string const& message, std::filesystem::path const& path = {});

  unpack_options_t const m_options;
  std::vector<keyword_t> const m_keywords;

  std::unordered_map<std::string, int> m_name_counts = {};
  std::map<std::string, std::vector<std::string>> m_keyword_blocks = {};  // key -> blocks

  unpack_results_t m_results = {};
  bool m_flushed = false;
};

//! Scan, route and flush a complete playlist text.
auto unpack_playlist(std::string const& text, unpack_options_t const& options) -> unpack_results_t;
