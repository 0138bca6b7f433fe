// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

//
// Only "#EXTINF" (for the display name) and the resource line following it are
// interpreted, every other "#..." line is skipped.
// See https://en.wikipedia.org/wiki/M3U
//

inline constexpr std::string_view EXTM3U = "#EXTM3U";
inline constexpr std::string_view EXTINF = "#EXTINF";

//! One playlist item: the #EXTINF line and the line(s) locating the resource.
struct entry_t
{
  std::string extinf;
  std::vector<std::string> resources;
  std::string channel_name;  // sanitized

  //! The entry as it is written to a playlist, each line terminated by '\n'.
  auto block() const -> std::string;
};

//! Sanitized display name of an #EXTINF line, the text after the first comma.
//! Without a comma the name is UNKNOWN_NAME.
auto channel_name_from_extinf(std::string const& line) -> std::string;

/**
 * Feed the lines of a playlist one by one, every completed entry is returned.
 *
 * An entry is started by an #EXTINF line and completed by the next line that
 * is neither blank nor a comment. Further resource lines up to the next
 * #EXTINF are dropped. A new #EXTINF replaces an incomplete entry.
 */
class m3u_scanner_t
{
public:

  enum class state_t
  {
    awaiting_metadata,
    awaiting_resource,
  };

  m3u_scanner_t() = default;

  auto feed(std::string const& line) -> std::optional<entry_t>;

  inline auto state() const -> state_t { return m_state; }

  //! An incomplete entry is waiting for its resource line.
  //! At the end of the input it is simply dropped.
  inline bool has_pending() const { return m_state == state_t::awaiting_resource; }

private:

  void start_entry(std::string const& line);
  auto complete_entry(std::string const& line) -> entry_t;

  state_t m_state = state_t::awaiting_metadata;
  entry_t m_pending = {};
};

//! All entries of a playlist text in playlist order.
auto scan_entries(std::string const& text) -> std::vector<entry_t>;
