#ifndef AUTOINST_REPOS_HPP
#define AUTOINST_REPOS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::repos {

struct CustomRepo final {
    std::string name{};
    // Server url, may contain $repo and $arch
    std::string server{};
    std::string sig_level{};

    constexpr bool operator==(const CustomRepo&) const = default;
};

// Generates pacman.conf section for the repo
auto gen_repo_section(const CustomRepo& repo) noexcept -> std::string;

// Server url with $repo and $arch expanded
auto expand_server_url(const CustomRepo& repo, std::string_view arch = "x86_64") noexcept -> std::string;

// First active Server of a pacman mirrorlist, std::nullopt if every entry is commented out
auto find_first_server(std::string_view mirrorlist_content) noexcept -> std::optional<std::string>;

// Checks if the repo database can be reached
auto is_repo_reachable(const CustomRepo& repo) noexcept -> bool;

// Adds repo to pacman.conf, does nothing if the repo is already there
auto add_custom_repo(const CustomRepo& repo, std::string_view pacman_conf_path) noexcept -> bool;

// Enables [multilib] in pacman.conf, does nothing if already enabled
auto enable_multilib(std::string_view pacman_conf_path) noexcept -> bool;

}  // namespace autoinst::repos

#endif  // AUTOINST_REPOS_HPP
