// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <cassert>
#include <variant>

#include <fmt/format.h>

#include "file_util.h"
#include "naming.h"
#include "router.h"
#include "string_util.h"

namespace fs = std::filesystem;

output_router_t::output_router_t(unpack_options_t const& options)
  : m_options{options}, m_keywords{normalize_keywords(options.keywords)}
{
}

auto output_router_t::occurrences(std::string const& channel_name) const -> int
{
  auto const it = m_name_counts.find(channel_name);
  return it != m_name_counts.end() ? it->second : 0;
}

void output_router_t::route(entry_t const& entry)
{
  assert(not m_flushed and "route() after flush()");
  assert(not entry.resources.empty());

  if(entry.channel_name == UNKNOWN_NAME)
  {
    warn(warning_kind_t::unnamed_entry, fmt::format("Skipping unknown channel for URL: {}", entry.resources.front()));
    return;
  }

  int const seq = ++m_name_counts[entry.channel_name];
  write_entry(entry, seq);

  // A channel can end up in several keyword files.
  for(auto const& key : match_keywords(entry.channel_name, m_keywords, m_options.match_mode))
    m_keyword_blocks[key].push_back(entry.block());
}

void output_router_t::write_entry(entry_t const& entry, int seq)
{
  auto result = build_entry_path(m_options.base_dir, entry.channel_name, seq, use_subdir(), m_options.limits);
  if(std::holds_alternative<fs::filesystem_error>(result))
  {
    auto const& error = std::get<fs::filesystem_error>(result);
    warn(warning_kind_t::write_failed,
        fmt::format("Failed to write {}: {}", error.path1().string(), error.code().message()), error.path1());
    return;
  }

  fs::path const path = std::get<fs::path>(result);
  if(auto error = write_file(path, entry.block()); error.has_value())
  {
    warn(warning_kind_t::write_failed,
        fmt::format("Failed to write {}: {}", path.string(), error->code().message()), path);
    return;
  }

  m_results.written_files.push_back(path);
}

void output_router_t::flush()
{
  if(m_flushed)
    return;
  m_flushed = true;

  for(auto const& keyword : m_keywords)
  {
    auto const it = m_keyword_blocks.find(keyword.key);
    if(it == m_keyword_blocks.end() or it->second.empty())
      continue; // no empty keyword files

    auto result = build_keyword_path(m_options.base_dir, keyword.original, m_options.limits);
    if(std::holds_alternative<fs::filesystem_error>(result))
    {
      auto const& error = std::get<fs::filesystem_error>(result);
      warn(warning_kind_t::write_failed,
          fmt::format("Failed to write keyword file {}: {}", error.path1().string(), error.code().message()),
          error.path1());
      continue;
    }

    std::string text = std::string{EXTM3U} + "\n";
    for(auto const& block : it->second)
      text += block;

    fs::path const path = std::get<fs::path>(result);
    if(auto error = write_file(path, text); error.has_value())
    {
      warn(warning_kind_t::write_failed,
          fmt::format("Failed to write keyword file {}: {}", path.string(), error->code().message()), path);
      continue;
    }

    m_results.written_files.push_back(path);
  }
}

void output_router_t::warn(warning_kind_t kind, std::string const& message, fs::path const& path)
{
  m_results.warnings.push_back(unpack_warning_t{kind, message, path});
}

// ---

auto unpack_playlist(std::string const& text, unpack_options_t const& options) -> unpack_results_t
{
  output_router_t router{options};

  // Every entry is routed as soon as the scanner completes it.
  m3u_scanner_t scanner;
  for(auto const& line : split_lines(text))
  {
    if(auto entry = scanner.feed(line); entry.has_value())
      router.route(entry.value());
  }

  router.flush();

  return router.results();
}
