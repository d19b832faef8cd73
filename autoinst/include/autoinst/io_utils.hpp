#ifndef AUTOINST_IO_UTILS_HPP
#define AUTOINST_IO_UTILS_HPP

#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::utils {

/// Callback receiving one line of a followed process output (without trailing newline).
using LineCallback = std::function<void(std::string_view)>;

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Runs command through the shell and captures its stdout.
/// @return The output with the trailing newline stripped, "-1" if the pipe could not be opened.
auto exec(std::string_view command, bool interactive = false) noexcept -> std::string;

/// @brief Runs command through the shell.
/// @return True if the command exited with status 0.
auto exec_checked(std::string_view command) noexcept -> bool;

/// @brief Runs command through the shell and forwards combined output line by line.
/// @param command The command to run.
/// @param line_callback Invoked for every output line, on the calling thread.
/// @return True if the command exited with status 0.
auto exec_follow(std::string_view command, const LineCallback& line_callback) noexcept -> bool;

/// @brief Runs command as root inside the change root at mountpoint.
auto arch_chroot_checked(std::string_view command, std::string_view mountpoint) noexcept -> bool;

/// @brief Runs command with a login shell of username inside the change root at mountpoint.
auto arch_chroot_user_checked(std::string_view command, std::string_view username, std::string_view mountpoint) noexcept -> bool;

}  // namespace autoinst::utils

#endif  // AUTOINST_IO_UTILS_HPP
