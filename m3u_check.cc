// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <filesystem>
#include <iostream> // std::cout
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "file_util.h"
#include "keywords.h"
#include "m3u.h"
#include "naming.h"
#include "paths.h"

void print_usage(std::string const& progname);

//! Show what m3u_unpack would write for a local playlist, without writing anything.
int main(int argc, char** argv)
{
  int first_arg = 1;
  match_mode_t mode = match_mode_t::substring;
  if(argc > 1 and std::string{argv[1]} == "-w")
  {
    mode = match_mode_t::whole_word;
    first_arg++;
  }

  if(argc <= first_arg)
  {
    print_usage(argv[0]);
    return 1;
  }

  std::filesystem::path const file = argv[first_arg];
  auto const keywords = normalize_keywords(std::vector<std::string>(argv + first_arg + 1, argv + argc));

  auto result = read_file(file);
  if(std::holds_alternative<std::filesystem::filesystem_error>(result))
  {
    std::cerr << fmt::format("Error: {}!", std::get<std::filesystem::filesystem_error>(result).what()) << std::endl;
    return 1;
  }

  std::unordered_map<std::string, int> name_counts = {};
  for(auto const& entry : scan_entries(std::get<std::string>(result)))
  {
    if(entry.channel_name == UNKNOWN_NAME)
    {
      std::cout << fmt::format("?? {}", entry.resources.front()) << std::endl;
      continue;
    }

    int const seq = ++name_counts[entry.channel_name];
    std::string line = fmt::format("-> {}{}", entry_file_stem(entry.channel_name, seq), M3U_EXTENSION);

    for(auto const& key : match_keywords(entry.channel_name, keywords, mode))
      line += fmt::format(" [{}]", key);
    std::cout << line << std::endl;

    size_t const w = 40;
    std::string const& url = entry.resources.front();
    std::cout << fmt::format("   {:.<{}}", (url.size() > w ? url.substr(0, w-3) : url), url.size() > w ? w : url.size())
      << std::endl;
  }

  return 0;
}

void print_usage(std::string const& progname)
{
  std::cout << fmt::format("Usage: {} [-w] <m3u-file> [keyword...]\n"
                           "-w\tKeywords only match whole words (as m3u_unpack --whole-word).", progname) << std::endl;
}
