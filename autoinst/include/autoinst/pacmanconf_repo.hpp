#ifndef AUTOINST_PACMANCONF_REPO_HPP
#define AUTOINST_PACMANCONF_REPO_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::detail::pacmanconf {

// Appends the repo section to the end of the file
auto push_repos_back(std::string_view file_path, std::string_view value) noexcept -> bool;

// Uncomments the "#[repo_name]" header and the option lines following it
auto uncomment_repo(std::string_view file_path, std::string_view repo_name) noexcept -> bool;

// Returns enabled repo headers, e.g "[core]"
auto get_repo_list(std::string_view file_path) noexcept -> std::vector<std::string>;

}  // namespace autoinst::detail::pacmanconf

#endif  // AUTOINST_PACMANCONF_REPO_HPP
