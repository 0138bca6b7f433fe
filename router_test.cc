// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <map>
#include <string>

#include "router.h"
#include "test_util.h"

namespace fs = std::filesystem;

std::string const channels_m3u =
  "#EXTM3U\n"
  "#EXTINF:-1,Channel One\n"
  "http://x/1\n"
  "#EXTINF:-1,Channel One\n"
  "http://x/2\n"
  "#EXTINF:-1,Sports HD\n"
  "http://x/3\n"
  "#EXTINF:-1,CHDX News\n"
  "http://x/4\n"
  "#EXTINF:-1\n"
  "http://x/nameless\n"
;

//! All regular files below dir with their content, keyed by the relative path.
auto collect_files(fs::path const& dir) -> std::map<std::string, std::string>
{
  std::map<std::string, std::string> ret = {};
  for(auto const& entry : fs::recursive_directory_iterator(dir))
  {
    if(entry.is_regular_file())
      ret[fs::relative(entry.path(), dir).string()] = slurp(entry.path());
  }
  return ret;
}

TEST(router_tests, per_entry_files)
{
  tmpdir_t tmp;

  unpack_options_t options;
  options.base_dir = tmp.path();

  auto const results = unpack_playlist(channels_m3u, options);

  EXPECT_EQ(results.written_files.size(), 4);

  // No keywords, no iptv subdirectory.
  EXPECT_EQ(slurp(tmp.path() / "Channel One" / "Channel One.m3u"),   "#EXTINF:-1,Channel One\nhttp://x/1\n");
  EXPECT_EQ(slurp(tmp.path() / "Channel One" / "Channel One_2.m3u"), "#EXTINF:-1,Channel One\nhttp://x/2\n");
  EXPECT_EQ(slurp(tmp.path() / "Sports HD" / "Sports HD.m3u"),       "#EXTINF:-1,Sports HD\nhttp://x/3\n");
  EXPECT_FALSE(fs::exists(tmp.path() / "iptv"));
  EXPECT_FALSE(fs::exists(tmp.path() / "unknown"));

  ASSERT_EQ(results.warnings.size(), 1);
  EXPECT_EQ(results.warnings[0].kind, warning_kind_t::unnamed_entry);
  EXPECT_EQ(results.warnings[0].message, "Skipping unknown channel for URL: http://x/nameless");
}

TEST(router_tests, keyword_files)
{
  tmpdir_t tmp;

  unpack_options_t options;
  options.base_dir = tmp.path();
  options.keywords = {"HD", "news", "Movies"};

  auto const results = unpack_playlist(channels_m3u, options);

  EXPECT_TRUE(fs::is_regular_file(tmp.path() / "iptv" / "Channel One" / "Channel One_2.m3u"));
  EXPECT_FALSE(fs::exists(tmp.path() / "Channel One"));

  // Substring mode: CHDX News is in both keyword files.
  EXPECT_EQ(slurp(tmp.path() / "HD.m3u"),
      "#EXTM3U\n"
      "#EXTINF:-1,Sports HD\nhttp://x/3\n"
      "#EXTINF:-1,CHDX News\nhttp://x/4\n");
  EXPECT_EQ(slurp(tmp.path() / "news.m3u"),
      "#EXTM3U\n"
      "#EXTINF:-1,CHDX News\nhttp://x/4\n");

  // Never matched -> no file.
  EXPECT_FALSE(fs::exists(tmp.path() / "Movies.m3u"));

  EXPECT_EQ(results.written_files.size(), 6);
  EXPECT_EQ(results.written_files.back(), tmp.path() / "news.m3u");
}

TEST(router_tests, whole_word_keyword)
{
  tmpdir_t tmp;

  unpack_options_t options;
  options.base_dir = tmp.path();
  options.keywords = {"HD"};
  options.match_mode = match_mode_t::whole_word;

  unpack_playlist(channels_m3u, options);

  EXPECT_EQ(slurp(tmp.path() / "HD.m3u"),
      "#EXTM3U\n"
      "#EXTINF:-1,Sports HD\nhttp://x/3\n");
}

TEST(router_tests, flat_layout_with_keywords)
{
  tmpdir_t tmp;

  unpack_options_t options;
  options.base_dir = tmp.path();
  options.keywords = {"one"};
  options.flat = true;

  output_router_t router{options};
  EXPECT_FALSE(router.use_subdir());

  for(auto const& entry : scan_entries(channels_m3u))
    router.route(entry);
  router.flush();
  router.flush(); // second flush writes nothing

  EXPECT_EQ(router.occurrences("Channel One"), 2);
  EXPECT_EQ(router.occurrences("Nothing"), 0);

  EXPECT_TRUE(fs::is_regular_file(tmp.path() / "Channel One" / "Channel One.m3u"));
  EXPECT_EQ(slurp(tmp.path() / "one.m3u"),
      "#EXTM3U\n"
      "#EXTINF:-1,Channel One\nhttp://x/1\n"
      "#EXTINF:-1,Channel One\nhttp://x/2\n");
  EXPECT_EQ(router.results().written_files.size(), 5);
}

TEST(router_tests, write_failure_is_not_fatal)
{
  tmpdir_t tmp;

  // A directory where the first Channel One file should go.
  fs::create_directories(tmp.path() / "Channel One" / "Channel One.m3u");

  unpack_options_t options;
  options.base_dir = tmp.path();

  auto const results = unpack_playlist(channels_m3u, options);

  auto const write_failures = std::ranges::count_if(results.warnings,
      [](unpack_warning_t const& w) { return w.kind == warning_kind_t::write_failed; });
  ASSERT_EQ(write_failures, 1);

  auto const it = std::ranges::find_if(results.warnings,
      [](unpack_warning_t const& w) { return w.kind == warning_kind_t::write_failed; });
  EXPECT_EQ(it->path, tmp.path() / "Channel One" / "Channel One.m3u");
  EXPECT_TRUE(it->message.starts_with("Failed to write " + it->path.string() + ": "));

  // The following entries are written nevertheless, the sequence number is used up.
  EXPECT_TRUE(fs::is_regular_file(tmp.path() / "Channel One" / "Channel One_2.m3u"));
  EXPECT_TRUE(fs::is_regular_file(tmp.path() / "Sports HD" / "Sports HD.m3u"));
  EXPECT_EQ(results.written_files.size(), 3);
}

TEST(router_tests, keyword_write_failure)
{
  tmpdir_t tmp;
  fs::create_directories(tmp.path() / "HD.m3u");

  unpack_options_t options;
  options.base_dir = tmp.path();
  options.keywords = {"HD", "One"};

  auto const results = unpack_playlist(channels_m3u, options);

  ASSERT_EQ(results.warnings.size(), 2); // nameless entry + HD.m3u
  EXPECT_EQ(results.warnings[1].kind, warning_kind_t::write_failed);
  EXPECT_EQ(results.warnings[1].path, tmp.path() / "HD.m3u");

  EXPECT_TRUE(fs::is_regular_file(tmp.path() / "One.m3u"));
}

TEST(router_tests, deterministic_output)
{
  tmpdir_t tmp1{"-1"};
  tmpdir_t tmp2{"-2"};

  unpack_options_t options;
  options.keywords = {"HD", "Channel", "News"};

  options.base_dir = tmp1.path();
  unpack_playlist(channels_m3u, options);

  options.base_dir = tmp2.path();
  unpack_playlist(channels_m3u, options);

  auto const files1 = collect_files(tmp1.path());
  auto const files2 = collect_files(tmp2.path());

  EXPECT_EQ(files1.size(), 7);
  EXPECT_EQ(files1, files2);
}

TEST(router_tests, dot_names_stay_inside_base_dir)
{
  tmpdir_t tmp;
  fs::path const base = tmp.path() / "base";

  unpack_options_t options;
  options.base_dir = base;
  options.keywords = {"..", "."};
  options.flat = true;

  auto const results = unpack_playlist(
    "#EXTINF:-1,..\n"
    "http://x/parent\n"
    "#EXTINF:-1,.\n"
    "http://x/current\n"
    "#EXTINF:-1,Sport .. News\n"
    "http://x/sport\n",
    options);

  EXPECT_TRUE(results.warnings.empty());
  EXPECT_TRUE(fs::is_regular_file(base / "__" / "__.m3u"));
  EXPECT_TRUE(fs::is_regular_file(base / "_" / "_.m3u"));

  // Keyword files named by dots are sanitized the same way.
  EXPECT_TRUE(fs::is_regular_file(base / "__.m3u"));
  EXPECT_TRUE(fs::is_regular_file(base / "_.m3u"));

  ASSERT_EQ(results.written_files.size(), 5);
  for(auto const& path : results.written_files)
  {
    auto const relative = fs::relative(path, base);
    ASSERT_FALSE(relative.empty()) << path;
    EXPECT_NE(*relative.begin(), fs::path{".."}) << path;
  }

  // Nothing next to the base directory.
  EXPECT_EQ(std::distance(fs::directory_iterator(tmp.path()), fs::directory_iterator()), 1);
}

TEST(router_tests, entries_are_written_while_scanning)
{
  tmpdir_t tmp;

  unpack_options_t options;
  options.base_dir = tmp.path();

  output_router_t router{options};
  m3u_scanner_t scanner;

  EXPECT_FALSE(scanner.feed("#EXTINF:-1,Channel One").has_value());

  auto entry = scanner.feed("http://x/1");
  ASSERT_TRUE(entry.has_value());
  router.route(entry.value());

  // Written before the rest of the playlist is seen.
  EXPECT_EQ(slurp(tmp.path() / "Channel One" / "Channel One.m3u"), "#EXTINF:-1,Channel One\nhttp://x/1\n");
  EXPECT_EQ(router.results().written_files.size(), 1);

  EXPECT_FALSE(scanner.feed("#EXTINF:-1,Channel Two").has_value());
  EXPECT_FALSE(fs::exists(tmp.path() / "Channel Two"));
}
