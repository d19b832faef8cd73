#include "autoinst/repos.hpp"
#include "autoinst/fetch_file.hpp"
#include "autoinst/pacmanconf_repo.hpp"
#include "autoinst/string_utils.hpp"

#include <algorithm>  // for find
#include <vector>     // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto replace_all(std::string str, std::string_view from, std::string_view to) noexcept -> std::string {
    std::size_t pos{};
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

auto has_repo(std::string_view pacman_conf_path, std::string_view repo_name) noexcept -> bool {
    const auto& repo_list   = autoinst::detail::pacmanconf::get_repo_list(pacman_conf_path);
    const auto& repo_header = fmt::format(FMT_COMPILE("[{}]"), repo_name);
    return std::ranges::find(repo_list, repo_header) != repo_list.end();
}

}  // namespace

namespace autoinst::repos {

auto gen_repo_section(const CustomRepo& repo) noexcept -> std::string {
    std::string section = fmt::format(FMT_COMPILE("[{}]\n"), repo.name);
    if (!repo.sig_level.empty()) {
        section += fmt::format(FMT_COMPILE("SigLevel = {}\n"), repo.sig_level);
    }
    section += fmt::format(FMT_COMPILE("Server = {}"), repo.server);
    return section;
}

auto expand_server_url(const CustomRepo& repo, std::string_view arch) noexcept -> std::string {
    auto url = replace_all(repo.server, "$repo"sv, repo.name);
    return replace_all(std::move(url), "$arch"sv, arch);
}

auto find_first_server(std::string_view mirrorlist_content) noexcept -> std::optional<std::string> {
    for (auto&& line : utils::make_split_view(mirrorlist_content)) {
        const auto& entry = utils::trim(line);
        if (!entry.starts_with("Server"sv)) {
            continue;
        }
        // e.g Server = https://geo.mirror.pkgbuild.com/$repo/os/$arch
        const auto eq_pos = entry.find('=');
        if (eq_pos == std::string_view::npos || utils::trim(entry.substr(6, eq_pos - 6)) != ""sv) {
            continue;
        }
        const auto& server = utils::trim(entry.substr(eq_pos + 1));
        if (!server.empty()) {
            return std::make_optional<std::string>(server);
        }
    }
    return std::nullopt;
}

auto is_repo_reachable(const CustomRepo& repo) noexcept -> bool {
    // the sync database is what pacman fetches first
    const auto& db_url = fmt::format(FMT_COMPILE("{}/{}.db"), expand_server_url(repo), repo.name);
    spdlog::info("Probing repository '{}' at {}", repo.name, db_url);
    return fetch::is_url_reachable(db_url);
}

auto add_custom_repo(const CustomRepo& repo, std::string_view pacman_conf_path) noexcept -> bool {
    if (has_repo(pacman_conf_path, repo.name)) {
        spdlog::info("'{}' is already added!", repo.name);
        return true;
    }

    if (!detail::pacmanconf::push_repos_back(pacman_conf_path, gen_repo_section(repo))) {
        spdlog::error("Failed to add repo '{}' into {}", repo.name, pacman_conf_path);
        return false;
    }
    spdlog::info("Added repo '{}' into {}", repo.name, pacman_conf_path);
    return true;
}

auto enable_multilib(std::string_view pacman_conf_path) noexcept -> bool {
    if (has_repo(pacman_conf_path, "multilib"sv)) {
        spdlog::info("multilib is already enabled in {}", pacman_conf_path);
        return true;
    }

    if (!detail::pacmanconf::uncomment_repo(pacman_conf_path, "multilib"sv)) {
        spdlog::error("Failed to enable multilib in {}", pacman_conf_path);
        return false;
    }
    return true;
}

}  // namespace autoinst::repos
