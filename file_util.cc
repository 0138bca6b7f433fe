// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error> // std::error_code

#include "file_util.h"

namespace fs = std::filesystem;

namespace
{
  auto errno_error(std::string const& what, fs::path const& path) -> fs::filesystem_error
  {
    int const err = errno;
    auto errc = std::error_code{err != 0 ? err : EIO, std::generic_category()};
    return fs::filesystem_error{what, path, errc};
  }
} // namespace

auto read_file(fs::path const& path) -> std::variant<std::string, fs::filesystem_error>
{
  errno = 0;
  std::ifstream file{path, std::ios::binary};
  if(file.fail())
    return errno_error("Couldn't open file for reading", path);

  std::string text{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
  if(file.bad())
    return errno_error("Couldn't read file", path);

  return text;
}

auto write_file(fs::path const& path, std::string const& text) -> std::optional<fs::filesystem_error>
{
  errno = 0;
  std::ofstream file{path, std::ios::binary | std::ios::trunc};
  if(file.fail())
    return errno_error("Couldn't open file for writing", path);

  file.write(text.data(), text.size());
  file.close();
  if(file.fail())
    return errno_error("Couldn't write file", path);

  return {};
}

auto ensure_directory(fs::path const& dir) -> std::optional<fs::filesystem_error>
{
  std::error_code errc;
  fs::create_directories(dir, errc);
  if(errc)
    return fs::filesystem_error{"Couldn't create directory", dir, errc};

  if(not fs::is_directory(dir, errc))
    return fs::filesystem_error{"Not a directory", dir, std::make_error_code(std::errc::not_a_directory)};

  return {};
}
