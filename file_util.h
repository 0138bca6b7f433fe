// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

auto read_file(std::filesystem::path const& path) -> std::variant<std::string, std::filesystem::filesystem_error>;

//! Create or truncate path and write text into it.
auto write_file(std::filesystem::path const& path, std::string const& text) -> std::optional<std::filesystem::filesystem_error>;

//! Create dir and all missing parents. An existing directory is not an error.
auto ensure_directory(std::filesystem::path const& dir) -> std::optional<std::filesystem::filesystem_error>;
