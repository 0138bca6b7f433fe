// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <string>
#include <string_view>

//! Name used for entries without a usable display name.
inline constexpr std::string_view UNKNOWN_NAME = "unknown";

//! Make a display string usable as a single file or folder name:
//! non-breaking spaces become spaces, \ / * ? : " < > | become '_',
//! whitespace runs collapse into one space and the ends are trimmed.
//! An empty result is replaced by UNKNOWN_NAME, a result of only dots by as many '_'.
auto safe_name(std::string const& raw) -> std::string;

//! Shorten stem to limit characters (code points), the last three being "...".
//! Stems that fit are returned unchanged.
auto truncate_with_ellipsis(std::string const& stem, size_t limit) -> std::string;
