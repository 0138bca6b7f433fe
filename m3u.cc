// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <cassert>
#include <utility> // std::exchange

#include "m3u.h"
#include "naming.h"
#include "string_util.h"

auto entry_t::block() const -> std::string
{
  std::string ret = extinf + "\n";
  for(auto const& resource : resources)
    ret += resource + "\n";
  return ret;
}

auto channel_name_from_extinf(std::string const& line) -> std::string
{
  auto const pos = line.find(',');
  if(pos == std::string::npos)
    return std::string{UNKNOWN_NAME};

  return safe_name(line.substr(pos+1));
}

// ---

auto m3u_scanner_t::feed(std::string const& line) -> std::optional<entry_t>
{
  if(line.starts_with(EXTINF))
  {
    start_entry(line);
    return {};
  }

  bool const is_resource = not trim(line).empty() and not line.starts_with('#');
  if(is_resource and m_state == state_t::awaiting_resource)
    return complete_entry(line);

  // Blank line, other comment or a resource without #EXTINF.
  return {};
}

void m3u_scanner_t::start_entry(std::string const& line)
{
  m_pending = entry_t{line, {}, channel_name_from_extinf(line)};
  m_state = state_t::awaiting_resource;
}

auto m3u_scanner_t::complete_entry(std::string const& line) -> entry_t
{
  assert(m_state == state_t::awaiting_resource);

  m_pending.resources.push_back(line);
  m_state = state_t::awaiting_metadata;

  return std::exchange(m_pending, entry_t{});
}

// ---

auto scan_entries(std::string const& text) -> std::vector<entry_t>
{
  std::vector<entry_t> entries = {};

  m3u_scanner_t scanner;
  for(auto const& line : split_lines(text))
  {
    if(auto entry = scanner.feed(line); entry.has_value())
      entries.push_back(std::move(entry.value()));
  }

  return entries;
}
