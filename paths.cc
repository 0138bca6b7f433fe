// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <cassert>
#include <string>

#include "file_util.h"
#include "naming.h"
#include "paths.h"

namespace fs = std::filesystem;

auto entry_file_stem(std::string const& channel_name, int seq, path_limits_t const& limits) -> std::string
{
  assert(seq >= 1);

  std::string const stem = seq > 1 ? channel_name + "_" + std::to_string(seq) : channel_name;
  return truncate_with_ellipsis(stem, limits.max_file_chars);
}

auto build_entry_path(fs::path const& base_dir, std::string const& channel_name, int seq,
    bool use_subdir, path_limits_t const& limits)
  -> std::variant<fs::path, fs::filesystem_error>
{
  assert(not channel_name.empty());

  fs::path dir = use_subdir ? base_dir / fs::path{ENTRY_SUBDIR} : base_dir;
  dir /= truncate_with_ellipsis(channel_name, limits.max_folder_chars);

  if(auto error = ensure_directory(dir); error.has_value())
    return error.value();

  return dir / (entry_file_stem(channel_name, seq, limits) + std::string{M3U_EXTENSION});
}

auto build_keyword_path(fs::path const& base_dir, std::string const& keyword, path_limits_t const& limits)
  -> std::variant<fs::path, fs::filesystem_error>
{
  if(auto error = ensure_directory(base_dir); error.has_value())
    return error.value();

  std::string const stem = truncate_with_ellipsis(safe_name(keyword), limits.max_file_chars);
  return base_dir / (stem + std::string{M3U_EXTENSION});
}
