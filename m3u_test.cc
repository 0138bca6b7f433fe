// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <gtest/gtest.h>
#include <string>

#include "m3u.h"

std::string const playlist_str =
  "#EXTM3U\n"
  "#EXTINF:-1 tvg-id=\"one\" group-title=\"News\",Channel One\n"
  "http://x/1\n"
  "\n"
  "#EXTINF:-1,Channel One\n"
  "#EXTGRP:News\n"
  "http://x/2\n"
  "#EXTINF:-1,Sports: HD\n"
  "http://x/3\n"
;

TEST(m3u_tests, channel_name_from_extinf)
{
  EXPECT_EQ(channel_name_from_extinf("#EXTINF:-1,Channel One"), "Channel One");
  EXPECT_EQ(channel_name_from_extinf("#EXTINF:-1 group-title=\"A\",  B/C  "), "B_C");
  EXPECT_EQ(channel_name_from_extinf("#EXTINF:-1,News, Weather"), "News, Weather");
  EXPECT_EQ(channel_name_from_extinf("#EXTINF:-1"), "unknown");
  EXPECT_EQ(channel_name_from_extinf("#EXTINF:-1,"), "unknown");
}

TEST(m3u_tests, scan_entries)
{
  auto const entries = scan_entries(playlist_str);

  ASSERT_EQ(entries.size(), 3);

  EXPECT_EQ(entries[0].channel_name, "Channel One");
  EXPECT_EQ(entries[0].extinf, "#EXTINF:-1 tvg-id=\"one\" group-title=\"News\",Channel One");
  ASSERT_EQ(entries[0].resources.size(), 1);
  EXPECT_EQ(entries[0].resources[0], "http://x/1");

  // #EXTGRP isn't part of the entry.
  EXPECT_EQ(entries[1].channel_name, "Channel One");
  EXPECT_EQ(entries[1].block(), "#EXTINF:-1,Channel One\nhttp://x/2\n");

  EXPECT_EQ(entries[2].channel_name, "Sports_ HD");
}

TEST(m3u_tests, scanner_states)
{
  m3u_scanner_t scanner;
  EXPECT_EQ(scanner.state(), m3u_scanner_t::state_t::awaiting_metadata);

  EXPECT_FALSE(scanner.feed("#EXTM3U").has_value());
  EXPECT_FALSE(scanner.feed("http://orphan").has_value()); // no #EXTINF before it
  EXPECT_EQ(scanner.state(), m3u_scanner_t::state_t::awaiting_metadata);

  EXPECT_FALSE(scanner.feed("#EXTINF:-1,A").has_value());
  EXPECT_EQ(scanner.state(), m3u_scanner_t::state_t::awaiting_resource);
  EXPECT_TRUE(scanner.has_pending());

  EXPECT_FALSE(scanner.feed("   ").has_value());
  EXPECT_FALSE(scanner.feed("#EXTVLCOPT:http-user-agent=x").has_value());
  EXPECT_EQ(scanner.state(), m3u_scanner_t::state_t::awaiting_resource);

  auto entry = scanner.feed("http://a");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->channel_name, "A");
  EXPECT_EQ(scanner.state(), m3u_scanner_t::state_t::awaiting_metadata);
  EXPECT_FALSE(scanner.has_pending());
}

TEST(m3u_tests, extra_resource_lines_are_dropped)
{
  auto const entries = scan_entries(
    "#EXTINF:-1,A\n"
    "http://a/1\n"
    "http://a/2\n"
    "#EXTINF:-1,B\n"
    "http://b/1\n");

  ASSERT_EQ(entries.size(), 2);
  EXPECT_EQ(entries[0].block(), "#EXTINF:-1,A\nhttp://a/1\n");
  EXPECT_EQ(entries[1].block(), "#EXTINF:-1,B\nhttp://b/1\n");
}

TEST(m3u_tests, incomplete_entries_are_dropped)
{
  auto const entries = scan_entries(
    "#EXTINF:-1,Replaced\n"
    "#EXTINF:-1,Kept\n"
    "http://kept\n"
    "#EXTINF:-1,At the end\n");

  ASSERT_EQ(entries.size(), 1);
  EXPECT_EQ(entries[0].channel_name, "Kept");
}

TEST(m3u_tests, unknown_entries_are_emitted)
{
  auto const entries = scan_entries("#EXTINF:-1\r\nhttp://nameless\r\n");

  ASSERT_EQ(entries.size(), 1);
  EXPECT_EQ(entries[0].channel_name, "unknown");
  EXPECT_EQ(entries[0].resources[0], "http://nameless");
}
