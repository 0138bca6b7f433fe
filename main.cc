// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <charconv> // std::from_chars
#include <iostream>
#include <optional>
#include <string>
#include <system_error> // std::errc
#include <utility>
#include <variant>
#include <vector>

#include <getopt.h>

#include <fmt/format.h>

#include "curl_wrapper.h"
#include "paths.h"
#include "router.h"

// ---

struct cmdline_t
{
  bool help_flag = false;
  bool verbose_flag = false;
  bool whole_word_flag = false;
  bool flat_flag = false;

  std::string url = "";
  std::string unpack_folder = "";
  std::vector<std::string> keywords = {};
  std::string useragent = "";

  path_limits_t limits = {};
};

auto download_playlist(curl_wrapper const& curl, std::string const& url) -> std::string; // throws on error
void print_warnings(std::vector<unpack_warning_t> const& warnings);

auto parse_options(int argc, char* argv[]) -> std::optional<cmdline_t>;
auto parse_limit(char const* arg, std::string const& option) -> std::optional<size_t>;
void print_usage(const char* progname);

// ---

int main(int argc, char** argv)
{
  auto const cmdline_result = parse_options(argc, argv);
  if(not cmdline_result.has_value())
  {
    print_usage(argv[0]);
    return -1;
  }
  cmdline_t const cmdline = cmdline_result.value();

  if(cmdline.help_flag)
  {
    print_usage(argv[0]);
    return 0;
  }

  int ret = 0;

  curl_wrapper::init();

  try
  {
    curl_wrapper curl;

    if(cmdline.verbose_flag)
      curl.set_verbose();
    if(not cmdline.useragent.empty())
      curl.useragent(cmdline.useragent);

    //
    // 1. Download the playlist, nothing is written before it is complete.
    //
    std::string const text = download_playlist(curl, cmdline.url);

    //
    // 2. Split it into the per-entry files and the keyword files.
    //
    unpack_options_t options;
    options.base_dir = cmdline.unpack_folder;
    options.keywords = cmdline.keywords;
    options.match_mode = cmdline.whole_word_flag ? match_mode_t::whole_word : match_mode_t::substring;
    options.flat = cmdline.flat_flag;
    options.limits = cmdline.limits;

    auto const results = unpack_playlist(text, options);

    if(cmdline.verbose_flag)
    {
      for(auto const& path : results.written_files)
        std::cout << fmt::format("Wrote: {}", path.string()) << std::endl;
    }

    // Failed writes are reported, but they don't fail the run.
    print_warnings(results.warnings);
  }
  catch(curl_wrapper_error const& error)
  {
    if(error.http_status() != 0)
      std::cerr << fmt::format("Error: {} (HTTP {}) while downloading {}!", error.what(), error.http_status(), error.url()) << std::endl;
    else
      std::cerr << fmt::format("Error: {} while downloading {}!", error.what(), error.url()) << std::endl;
    ret = -4;
  }

  curl_wrapper::cleanup();

  return ret;
}

auto download_playlist(curl_wrapper const& curl, std::string const& url) -> std::string
{
  auto result = curl.download_text(url);
  if(std::holds_alternative<curl_wrapper_error>(result))
    throw std::get<curl_wrapper_error>(result);

  return std::get<std::string>(std::move(result));
}

void print_warnings(std::vector<unpack_warning_t> const& warnings)
{
  for(auto const& warning : warnings)
    std::cerr << fmt::format("Warning: {}", warning.message) << std::endl;
}

// ---

void print_usage(const char* progname)
{
  std::cout << fmt::format(
    "Usage: {} [-v] [-w] [-f] [-k KEYWORD]... <-u|--m3u-url URL> <-o|--m3u-unpack-folder DIR>\n"
    "Options:\n"
    "--help, -h                    \tShow help.\n"
    "--verbose, -v                 \tEnable verbose output.\n"
    "--m3u-url, -u <URL>           \tUrl pointing to the M3U file.\n"
    "--m3u-unpack-folder, -o <DIR> \tBase folder to write the outputs to.\n"
    "--keyword, -k <KEYWORD>       \tCollect the channels whose name contains KEYWORD\n"
    "                              \tinto <DIR>/<KEYWORD>.m3u (can be given multiple times).\n"
    "--whole-word, -w              \tKeywords only match whole words.\n"
    "--flat, -f                    \tDon't put the channel folders into <DIR>/iptv.\n"
    "--user-agent, -a <UA>         \tUser agent for the download.\n"
    "--max-folder-chars <N>        \tMaximal length of a channel folder (default: 80).\n"
    "--max-file-chars <N>          \tMaximal length of a channel file name (default: 120).\n\n"
    "Download an M3U playlist and unpack it into one file per channel:\n"
    "<DIR>/[iptv/]<CHANNEL>/<CHANNEL>[_<N>].m3u\n", progname)
    << std::endl;
}

auto parse_options(int argc, char* argv[]) -> std::optional<cmdline_t>
{
  cmdline_t cmdline;

  enum : int
  {
    OPT_MAX_FOLDER_CHARS = 0x100,
    OPT_MAX_FILE_CHARS,
  };

  struct option long_options[] =
  {
    // long name, no_argument|required_argument, flag, val or nullptr
    {"help", no_argument, nullptr, 'h'},
    {"verbose", no_argument, nullptr, 'v'},
    {"m3u-url", required_argument, nullptr, 'u'},
    {"m3u-unpack-folder", required_argument, nullptr, 'o'},
    {"keyword", required_argument, nullptr, 'k'},
    {"whole-word", no_argument, nullptr, 'w'},
    {"flat", no_argument, nullptr, 'f'},
    {"user-agent", required_argument, nullptr, 'a'},
    {"max-folder-chars", required_argument, nullptr, OPT_MAX_FOLDER_CHARS},
    {"max-file-chars", required_argument, nullptr, OPT_MAX_FILE_CHARS},
    {nullptr, 0, nullptr, 0}
  };

  int c = 0;
  int option_index = 0;
  while((c = getopt_long(argc, argv, "hvu:o:k:wfa:", long_options, &option_index)) != -1)
  {
    switch(c)
    {
      case 'h':
        cmdline.help_flag = true;
        break;

      case 'v':
        cmdline.verbose_flag = true;
        break;

      case 'u':
        cmdline.url = optarg;
        break;

      case 'o':
        cmdline.unpack_folder = optarg;
        break;

      case 'k':
        cmdline.keywords.push_back(optarg);
        break;

      case 'w':
        cmdline.whole_word_flag = true;
        break;

      case 'f':
        cmdline.flat_flag = true;
        break;

      case 'a':
        cmdline.useragent = optarg;
        break;

      case OPT_MAX_FOLDER_CHARS:
        if(auto limit = parse_limit(optarg, "--max-folder-chars"))
          cmdline.limits.max_folder_chars = limit.value();
        else
          return {};
        break;

      case OPT_MAX_FILE_CHARS:
        if(auto limit = parse_limit(optarg, "--max-file-chars"))
          cmdline.limits.max_file_chars = limit.value();
        else
          return {};
        break;

      case '?': // getopt_long printed an error-message.
      default:
        return {};
    }
  }

  if(cmdline.help_flag)
    return cmdline;

  if(cmdline.url.empty())
  {
    std::cerr << "Error: An URL needs to be provided!" << std::endl;
    return {};
  }
  else if(cmdline.unpack_folder.empty())
  {
    std::cerr << "Error: An unpack folder needs to be provided!" << std::endl;
    return {};
  }
  else if(optind < argc) // Trailing stuff.
  {
    std::cerr << fmt::format("Error: Trailing stuff `{}' found!", argv[optind]) << std::endl;
    return {};
  }

  return cmdline;
}

//! Limits below 4 leave no room for a character besides the "...".
auto parse_limit(char const* arg, std::string const& option) -> std::optional<size_t>
{
  std::string const s{arg};

  size_t limit = 0;
  auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), limit);
  if(ec != std::errc{} or ptr != s.data() + s.size() or limit < 4)
  {
    std::cerr << fmt::format("Error: {} needs a number >= 4, got `{}'!", option, s) << std::endl;
    return {};
  }

  return limit;
}
