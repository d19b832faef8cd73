#include "config_applier.hpp"

// import autoinst
#include "autoinst/io_utils.hpp"
#include "autoinst/locale.hpp"
#include "autoinst/repos.hpp"
#include "autoinst/string_utils.hpp"
#include "autoinst/systemd_services.hpp"
#include "autoinst/user.hpp"

#include <array>       // for array
#include <filesystem>  // for copy_file, create_directories
#include <utility>     // for pair

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

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

constexpr auto SUDOERS_GROUP = "wheel"sv;

auto user_groups(const installer::UserProfile& user) noexcept -> std::vector<std::string> {
    auto groups = user.groups;
    if (user.sudo && !ranges::contains(groups, SUDOERS_GROUP)) {
        groups.emplace_back(SUDOERS_GROUP);
    }
    return groups;
}

auto copy_user_file(const installer::UserProfile& user, const installer::UserFile& file, std::string_view mountpoint) noexcept -> bool {
    const fs::path home_dir{fmt::format(FMT_COMPILE("/home/{}"), user.name)};
    const fs::path target_path = fs::path{mountpoint} / home_dir.relative_path() / file.destination;

    std::error_code err{};
    fs::create_directories(target_path.parent_path(), err);
    if (err) {
        spdlog::error("Failed to create '{}': {}", target_path.parent_path().string(), err.message());
        return false;
    }
    fs::copy_file(file.source, target_path, fs::copy_options::overwrite_existing, err);
    if (err) {
        spdlog::error("Failed to copy '{}' into '{}': {}", file.source, target_path.string(), err.message());
        return false;
    }

    // ownership of the whole top directory, which may have been created above
    const fs::path destination{file.destination};
    const auto& top_entry = *destination.begin();
    const auto& chown_cmd = fmt::format(FMT_COMPILE("chown -R {0}:{0} {1}"), user.name, autoinst::utils::shell_quote((home_dir / top_entry).string()));
    return autoinst::utils::arch_chroot_checked(chown_cmd, mountpoint);
}

auto set_git_identity(const installer::UserProfile& user, std::string_view mountpoint) noexcept -> bool {
    const std::array git_keys{
        std::pair{"user.name"sv, std::string_view{user.git_name}},
        std::pair{"user.email"sv, std::string_view{user.git_email}},
    };
    for (const auto& [git_key, git_value] : git_keys) {
        /* clang-format off */
        if (git_value.empty()) { continue; }
        /* clang-format on */
        const auto& git_cmd = fmt::format(FMT_COMPILE("git config --global {} {}"), git_key, autoinst::utils::shell_quote(git_value));
        if (!autoinst::utils::arch_chroot_user_checked(git_cmd, user.name, mountpoint)) {
            spdlog::error("Failed to set git {} for {}", git_key, user.name);
            return false;
        }
    }
    return true;
}

}  // namespace

namespace installer {

auto apply_step_to_string(ApplyStep step) noexcept -> std::string_view {
    switch (step) {
    case ApplyStep::HostnameLocale:
        return "hostname-locale"sv;
    case ApplyStep::Accounts:
        return "accounts"sv;
    case ApplyStep::Services:
        return "services"sv;
    case ApplyStep::Repositories:
        return "repositories"sv;
    case ApplyStep::UserSettings:
        return "user-settings"sv;
    }
    return "unknown"sv;
}

auto ApplyReport::summary() const noexcept -> std::string {
    std::vector<std::string> applied_names{};
    for (const auto step : applied) {
        applied_names.emplace_back(apply_step_to_string(step));
    }
    auto result = fmt::format(FMT_COMPILE("applied: {}"), applied_names.empty() ? std::string{"none"} : fmt::format("{}", fmt::join(applied_names, ", ")));
    if (failed_step.has_value()) {
        result += fmt::format(FMT_COMPILE("; failed: {}"), apply_step_to_string(*failed_step));
    }
    return result;
}

auto apply_hostname_locale(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool {
    if (!autoinst::user::set_hostname(profile.hostname, mountpoint)) {
        return false;
    }
    if (!autoinst::locale::set_locale(profile.locale, mountpoint)) {
        spdlog::error("Failed to set locale {}", profile.locale);
        return false;
    }
    return autoinst::locale::set_keymap(profile.keymap, mountpoint);
}

auto apply_accounts(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool {
    if (!profile.root_password_hash.empty() && !autoinst::user::set_root_password_hash(profile.root_password_hash, mountpoint)) {
        spdlog::error("Failed to set root password");
        return false;
    }

    for (const auto& user : profile.users) {
        const autoinst::user::UserInfo user_info{
            .username      = user.name,
            .password_hash = user.password_hash,
            .shell         = user.shell,
            .sudoers_group = user.sudo ? SUDOERS_GROUP : ""sv,
        };
        if (!autoinst::user::create_new_user(user_info, user_groups(user), mountpoint)) {
            spdlog::error("Failed to set up user {}", user.name);
            return false;
        }
    }
    return true;
}

auto apply_services(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool {
    for (const auto& service : profile.services) {
        if (!autoinst::services::enable_systemd_service(service, mountpoint)) {
            return false;
        }
    }
    return true;
}

auto apply_repositories(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool {
    const auto& pacman_conf_path = fmt::format(FMT_COMPILE("{}/etc/pacman.conf"), mountpoint);
    for (const auto& repo : profile.repositories) {
        if (!autoinst::repos::add_custom_repo(repo, pacman_conf_path)) {
            return false;
        }
    }
    if (profile.multilib && !autoinst::repos::enable_multilib(pacman_conf_path)) {
        return false;
    }
    return true;
}

auto gen_desktop_commands(const UserProfile& user) noexcept -> std::vector<std::string> {
    // gsettings needs a session bus, which doesn't exist inside the chroot
    static constexpr auto DBUS_LAUNCH = "dbus-launch --exit-with-session"sv;

    std::vector<std::string> commands{};
    commands.reserve(user.settings.size() + user.extensions.size());
    for (const auto& setting : user.settings) {
        commands.emplace_back(fmt::format(FMT_COMPILE("{} gsettings set {} {} {}"), DBUS_LAUNCH, setting.schema, setting.key, autoinst::utils::shell_quote(setting.value)));
    }
    for (const auto& extension : user.extensions) {
        commands.emplace_back(fmt::format(FMT_COMPILE("{} gnome-extensions enable {}"), DBUS_LAUNCH, extension));
    }
    return commands;
}

auto apply_user_settings(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool {
    for (const auto& user : profile.users) {
        for (const auto& file : user.files) {
            if (!copy_user_file(user, file, mountpoint)) {
                return false;
            }
        }
        if (!set_git_identity(user, mountpoint)) {
            return false;
        }
        for (const auto& command : user.commands) {
            if (!autoinst::utils::arch_chroot_user_checked(command, user.name, mountpoint)) {
                spdlog::error("Command '{}' failed for {}", command, user.name);
                return false;
            }
        }
        for (const auto& command : gen_desktop_commands(user)) {
            if (!autoinst::utils::arch_chroot_user_checked(command, user.name, mountpoint)) {
                spdlog::error("Desktop setting '{}' failed for {}", command, user.name);
                return false;
            }
        }
    }
    return true;
}

auto apply_config(const InstallProfile& profile, std::string_view mountpoint) noexcept -> ApplyReport {
    using step_func_t = bool (*)(const InstallProfile&, std::string_view) noexcept;
    static constexpr std::array<std::pair<ApplyStep, step_func_t>, 5> APPLY_STEPS{{
        {ApplyStep::HostnameLocale, &apply_hostname_locale},
        {ApplyStep::Accounts, &apply_accounts},
        {ApplyStep::Services, &apply_services},
        {ApplyStep::Repositories, &apply_repositories},
        {ApplyStep::UserSettings, &apply_user_settings},
    }};

    ApplyReport report{};
    for (const auto& [step, step_func] : APPLY_STEPS) {
        spdlog::info("Applying {}", apply_step_to_string(step));
        if (!step_func(profile, mountpoint)) {
            spdlog::error("Applying {} failed", apply_step_to_string(step));
            report.failed_step = step;
            break;
        }
        report.applied.push_back(step);
    }
    spdlog::info("Configuration {}", report.summary());
    return report;
}

}  // namespace installer
