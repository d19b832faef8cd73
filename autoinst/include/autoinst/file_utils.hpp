#ifndef AUTOINST_FILE_UTILS_HPP
#define AUTOINST_FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string;

// Reads line by line until EOF, for procfs files (mtab, swaps) which report zero size.
// Returns std::nullopt if the file can't be opened
auto read_virtual_file(std::string_view filepath) noexcept -> std::optional<std::string>;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
// Parent directories are created as needed.
auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool;

}  // namespace autoinst::file_utils

#endif  // AUTOINST_FILE_UTILS_HPP
