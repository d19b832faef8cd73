#include "autoinst/user.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/io_utils.hpp"
#include "autoinst/string_utils.hpp"

#include <filesystem>  // for exists, permissions

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <range/v3/algorithm/contains.hpp>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace {

auto db_has_name(std::string_view db_filepath, std::string_view name) noexcept -> bool {
    if (!fs::exists(db_filepath)) {
        return false;
    }
    const auto& db_content = autoinst::file_utils::read_whole_file(db_filepath);
    return autoinst::user::has_db_entry(db_content, name);
}

}  // namespace

namespace autoinst::user {

auto has_db_entry(std::string_view db_content, std::string_view name) noexcept -> bool {
    if (name.empty()) {
        return false;
    }
    for (auto&& line : utils::make_split_view(db_content)) {
        // e.g format: <name>:<password>:<uid>:...
        if (line.starts_with(name) && line.size() > name.size() && line[name.size()] == ':') {
            return true;
        }
    }
    return false;
}

auto user_exists(std::string_view username, std::string_view mountpoint) noexcept -> bool {
    return db_has_name(fmt::format(FMT_COMPILE("{}/etc/passwd"), mountpoint), username);
}

auto group_exists(std::string_view group, std::string_view mountpoint) noexcept -> bool {
    return db_has_name(fmt::format(FMT_COMPILE("{}/etc/group"), mountpoint), group);
}

auto create_group(std::string_view group, std::string_view mountpoint, bool is_system) noexcept -> bool {
    if (user::group_exists(group, mountpoint)) {
        spdlog::debug("group {} already exists", group);
        return true;
    }
    const auto& cmd = fmt::format(FMT_COMPILE("groupadd {}{}"), is_system ? "--system "sv : ""sv, group);
    return utils::arch_chroot_checked(cmd, mountpoint);
}

auto set_user_password_hash(std::string_view username, std::string_view password_hash, std::string_view mountpoint) noexcept -> bool {
    const auto& password_set_cmd = fmt::format(FMT_COMPILE("usermod -p {} {}"), utils::shell_quote(password_hash), username);
    if (!utils::arch_chroot_checked(password_set_cmd, mountpoint)) {
        spdlog::error("Failed to set password for user {}", username);
        return false;
    }
    return true;
}

auto create_new_user(const user::UserInfo& user_info, const std::vector<std::string>& default_groups, std::string_view mountpoint) noexcept -> bool {
    if (!user_info.sudoers_group.empty() && !ranges::contains(default_groups, user_info.sudoers_group)) {
        spdlog::error("Failed to create user {}! User default groups doesn't contain sudoers group({})", user_info.username, user_info.sudoers_group);
        return false;
    }

    // Create needed groups
    for (const auto& default_group : default_groups) {
        if (!user::create_group(default_group, mountpoint)) {
            spdlog::error("Failed to create group {}", default_group);
            return false;
        }
    }

    // Create the user
    if (user::user_exists(user_info.username, mountpoint)) {
        spdlog::info("User {} already exists, skipping useradd", user_info.username);
    } else {
        spdlog::info("Creating user {}", user_info.username);
        const auto& usercmd = [](auto&& username, auto&& user_shell) -> std::string {
            static constexpr auto USER_BASE_CMD = "useradd -m -U"sv;
            if (!user_shell.empty()) {
                return fmt::format(FMT_COMPILE("{} -s {} {}"), USER_BASE_CMD, user_shell, username);
            }
            return fmt::format(FMT_COMPILE("{} {}"), USER_BASE_CMD, username);
        }(user_info.username, user_info.shell);

        if (!utils::arch_chroot_checked(usercmd, mountpoint)) {
            spdlog::error("Failed to create user with {}", usercmd);
            return false;
        }
    }

    // Set user groups
    if (!default_groups.empty()) {
        spdlog::info("Setting groups for user {}", user_info.username);
        const auto& groups_set_cmd = fmt::format(FMT_COMPILE("usermod -aG {} {}"), utils::join(default_groups, ','), user_info.username);
        if (!utils::arch_chroot_checked(groups_set_cmd, mountpoint)) {
            spdlog::error("Failed to set user groups with {}", groups_set_cmd);
            return false;
        }
    }

    // Set user password
    if (!user::set_user_password_hash(user_info.username, user_info.password_hash, mountpoint)) {
        return false;
    }

    // Setup sudoers
    if (user_info.sudoers_group.empty()) {
        spdlog::info("skipping sudoers group is empty");
        return true;
    }

    const auto& sudoers_filepath = fmt::format(FMT_COMPILE("{}/etc/sudoers.d/10-autoinst"), mountpoint);
    const auto& sudoers_line     = fmt::format(FMT_COMPILE("%{} ALL=(ALL:ALL) ALL\n"), user_info.sudoers_group);
    // the drop-in is read-only once written
    if (fs::exists(sudoers_filepath) && file_utils::read_whole_file(sudoers_filepath) == sudoers_line) {
        spdlog::debug("sudoers drop-in {} is up to date", sudoers_filepath);
    } else if (!file_utils::create_file_for_overwrite(sudoers_filepath, sudoers_line)) {
        spdlog::error("Failed to open sudoers for writing {}", sudoers_filepath);
        return false;
    }

    std::error_code err{};
    fs::permissions(sudoers_filepath,
        fs::perms::owner_read | fs::perms::group_read,  // 0440
        fs::perm_options::replace, err);
    if (err) {
        spdlog::error("Failed to set permissions for sudoers file: {}", err.message());
        return false;
    }
    return true;
}

auto set_hostname(std::string_view hostname, std::string_view mountpoint) noexcept -> bool {
    {
        const auto& hostname_filepath = fmt::format(FMT_COMPILE("{}/etc/hostname"), mountpoint);
        const auto& hostname_line     = fmt::format(FMT_COMPILE("{}\n"), hostname);
        if (!file_utils::create_file_for_overwrite(hostname_filepath, hostname_line)) {
            spdlog::error("Failed to open hostname for writing {}", hostname_filepath);
            return false;
        }
    }

    if (!user::set_hosts(hostname, mountpoint)) {
        spdlog::error("Failed to set hosts");
        return false;
    }
    return true;
}

auto set_hosts(std::string_view hostname, std::string_view mountpoint) noexcept -> bool {
    static constexpr auto STANDARD_HOSTS = R"(# Standard host addresses
127.0.0.1  localhost
::1        localhost ip6-localhost ip6-loopback
ff02::1    ip6-allnodes
ff02::2    ip6-allrouters
)"sv;
    static constexpr auto REQUESTED_HOST = R"(# This host address
127.0.1.1  {}
)";

    const auto& hosts_filepath = fmt::format(FMT_COMPILE("{}/etc/hosts"), mountpoint);
    const auto& hosts_text     = fmt::format(FMT_COMPILE("{}{}"), STANDARD_HOSTS, hostname.empty() ? std::string{} : fmt::format(REQUESTED_HOST, hostname));
    if (!file_utils::create_file_for_overwrite(hosts_filepath, hosts_text)) {
        spdlog::error("Failed to open hosts for writing {}", hosts_filepath);
        return false;
    }
    return true;
}

auto set_root_password_hash(std::string_view password_hash, std::string_view mountpoint) noexcept -> bool {
    return set_user_password_hash("root"sv, password_hash, mountpoint);
}

}  // namespace autoinst::user
