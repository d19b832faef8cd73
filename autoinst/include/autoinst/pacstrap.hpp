#ifndef AUTOINST_PACSTRAP_HPP
#define AUTOINST_PACSTRAP_HPP

#include "autoinst/io_utils.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::pacstrap {

// Builds pacstrap command line for packages
auto gen_pacstrap_command(const std::vector<std::string>& packages, std::string_view root_mountpoint) noexcept -> std::string;

// Installs packages into root_mountpoint with pacstrap,
// output lines are forwarded to line_callback and the install log
auto install_packages(const std::vector<std::string>& packages, std::string_view root_mountpoint, const utils::LineCallback& line_callback) noexcept -> bool;

}  // namespace autoinst::pacstrap

#endif  // AUTOINST_PACSTRAP_HPP
