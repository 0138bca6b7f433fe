// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

//! Subdirectory that keeps the per-entry files apart from the keyword files.
inline constexpr std::string_view ENTRY_SUBDIR = "iptv";

inline constexpr std::string_view M3U_EXTENSION = ".m3u";

//! Folders and files are limited independently, folders being the shorter ones.
struct path_limits_t
{
  size_t max_folder_chars = 80;
  size_t max_file_chars = 120;  // without the extension
};

//! "<name>" for the first occurrence, "<name>_<seq>" for the following ones,
//! truncated to max_file_chars.
auto entry_file_stem(std::string const& channel_name, int seq, path_limits_t const& limits = {}) -> std::string;

//! <base_dir>/[iptv/]<folder>/<stem>.m3u
//! The directory of the returned path exists.
auto build_entry_path(std::filesystem::path const& base_dir, std::string const& channel_name, int seq,
    bool use_subdir, path_limits_t const& limits = {})
  -> std::variant<std::filesystem::path, std::filesystem::filesystem_error>;

//! <base_dir>/<keyword stem>.m3u
//! The keyword is sanitized and truncated like a file stem. base_dir exists afterwards.
auto build_keyword_path(std::filesystem::path const& base_dir, std::string const& keyword,
    path_limits_t const& limits = {})
  -> std::variant<std::filesystem::path, std::filesystem::filesystem_error>;
