#include "install_profile.hpp"

// import autoinst
#include "autoinst/file_utils.hpp"
#include "autoinst/io_utils.hpp"

#include <array>       // for array
#include <filesystem>  // for exists
#include <utility>     // for move

#include <ctre.hpp>  // for ctre::match

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace {

constexpr std::array DEFAULT_PROFILE_PATHS{
    "/etc/autoinst/profile.toml"sv,
    "/usr/share/autoinst/profile.toml"sv,
};

inline void parse_toml_array(const toml::array* arr, std::vector<std::string>& vec) noexcept {
    /* clang-format off */
    if (arr == nullptr) { return; }
    /* clang-format on */
    for (const auto& node_el : *arr) {
        if (auto elem = node_el.value<std::string_view>(); elem.has_value()) {
            vec.emplace_back(*elem);
        }
    }
}

template <typename T>
inline auto require_value(toml::node_view<const toml::node> node, std::string_view key_path) noexcept -> std::optional<T> {
    auto value = node.value<T>();
    if (!value.has_value()) {
        spdlog::error("Profile is missing required key '{}'", key_path);
    }
    return value;
}

auto parse_user(const toml::table& user_table) noexcept -> std::optional<installer::UserProfile> {
    auto name = require_value<std::string>(user_table["name"], "users.name"sv);
    /* clang-format off */
    if (!name.has_value()) { return std::nullopt; }
    /* clang-format on */

    installer::UserProfile user{.name = std::move(*name)};
    user.password_hash = user_table["password_hash"].value_or(""sv);
    user.shell         = user_table["shell"].value_or("/bin/bash"sv);
    user.sudo          = user_table["sudo"].value_or(false);
    user.git_name      = user_table["git_name"].value_or(""sv);
    user.git_email     = user_table["git_email"].value_or(""sv);
    parse_toml_array(user_table["groups"].as_array(), user.groups);
    parse_toml_array(user_table["commands"].as_array(), user.commands);
    parse_toml_array(user_table["extensions"].as_array(), user.extensions);

    if (const auto* files = user_table["files"].as_array()) {
        for (const auto& file_node : *files) {
            const auto* file_table = file_node.as_table();
            if (file_table == nullptr) {
                spdlog::error("users.files of '{}' must be an array of tables", user.name);
                return std::nullopt;
            }
            auto source      = require_value<std::string>((*file_table)["source"], "users.files.source"sv);
            auto destination = require_value<std::string>((*file_table)["destination"], "users.files.destination"sv);
            /* clang-format off */
            if (!source || !destination) { return std::nullopt; }
            /* clang-format on */
            user.files.emplace_back(installer::UserFile{.source = std::move(*source), .destination = std::move(*destination)});
        }
    }

    if (const auto* settings = user_table["settings"].as_array()) {
        for (const auto& setting_node : *settings) {
            const auto* setting_table = setting_node.as_table();
            if (setting_table == nullptr) {
                spdlog::error("users.settings of '{}' must be an array of tables", user.name);
                return std::nullopt;
            }
            auto schema = require_value<std::string>((*setting_table)["schema"], "users.settings.schema"sv);
            auto key    = require_value<std::string>((*setting_table)["key"], "users.settings.key"sv);
            auto value  = require_value<std::string>((*setting_table)["value"], "users.settings.value"sv);
            /* clang-format off */
            if (!schema || !key || !value) { return std::nullopt; }
            /* clang-format on */
            user.settings.emplace_back(installer::DesktopSetting{.schema = std::move(*schema), .key = std::move(*key), .value = std::move(*value)});
        }
    }
    return std::make_optional<installer::UserProfile>(std::move(user));
}

}  // namespace

namespace installer {

auto parse_install_profile(std::string_view profile_content) noexcept -> std::optional<InstallProfile> {
    toml::parse_result profile_doc = toml::parse(profile_content);
    if (profile_doc.failed()) {
        spdlog::error("Failed to parse profile: {}", profile_doc.error().description());
        return std::nullopt;
    }
    const auto& profile_table = std::move(profile_doc).table();

    InstallProfile profile{};

    auto hostname = require_value<std::string>(profile_table["system"]["hostname"], "system.hostname"sv);
    /* clang-format off */
    if (!hostname.has_value()) { return std::nullopt; }
    /* clang-format on */
    profile.hostname = std::move(*hostname);
    profile.locale   = profile_table["system"]["locale"].value_or("en_US.UTF-8"sv);
    profile.keymap   = profile_table["system"]["keymap"].value_or("us"sv);
    profile.kernel   = profile_table["system"]["kernel"].value_or("linux"sv);

    parse_toml_array(profile_table["packages"]["list"].as_array(), profile.packages);
    parse_toml_array(profile_table["services"]["enable"].as_array(), profile.services);

    if (const auto* repositories = profile_table["repositories"].as_array()) {
        for (const auto& repo_node : *repositories) {
            const auto* repo_table = repo_node.as_table();
            if (repo_table == nullptr) {
                spdlog::error("repositories must be an array of tables");
                return std::nullopt;
            }
            auto name   = require_value<std::string>((*repo_table)["name"], "repositories.name"sv);
            auto server = require_value<std::string>((*repo_table)["server"], "repositories.server"sv);
            /* clang-format off */
            if (!name || !server) { return std::nullopt; }
            /* clang-format on */
            profile.repositories.emplace_back(autoinst::repos::CustomRepo{
                .name      = std::move(*name),
                .server    = std::move(*server),
                .sig_level = std::string{(*repo_table)["sig_level"].value_or("Optional TrustAll"sv)},
            });
        }
    }
    profile.multilib = profile_table["pacman"]["multilib"].value_or(false);

    profile.root_password_hash = profile_table["root"]["password_hash"].value_or(""sv);

    if (const auto* users = profile_table["users"].as_array()) {
        for (const auto& user_node : *users) {
            const auto* user_table = user_node.as_table();
            if (user_table == nullptr) {
                spdlog::error("users must be an array of tables");
                return std::nullopt;
            }
            auto user = parse_user(*user_table);
            /* clang-format off */
            if (!user.has_value()) { return std::nullopt; }
            /* clang-format on */
            profile.users.emplace_back(std::move(*user));
        }
    }

    profile.mountpoint            = profile_table["installer"]["mountpoint"].value_or("/mnt/arch"sv);
    profile.base_install_attempts = profile_table["installer"]["base_install_attempts"].value_or(std::int32_t{3});
    profile.boot_timeout          = profile_table["installer"]["boot_timeout"].value_or(std::int32_t{15});

    return std::make_optional<InstallProfile>(std::move(profile));
}

auto is_valid_hostname(std::string_view hostname) noexcept -> bool {
    return static_cast<bool>(ctre::match<"[a-z0-9]([a-z0-9-]{0,61}[a-z0-9])?">(hostname));
}

auto is_valid_username(std::string_view username) noexcept -> bool {
    return static_cast<bool>(ctre::match<"[a-z_][a-z0-9_-]{0,31}">(username));
}

auto validate_install_profile(const InstallProfile& profile) noexcept -> bool {
    if (!is_valid_hostname(profile.hostname)) {
        spdlog::error("Invalid hostname '{}'", profile.hostname);
        return false;
    }
    if (profile.locale.empty() || profile.keymap.empty() || profile.kernel.empty()) {
        spdlog::error("Locale, keymap and kernel must not be empty");
        return false;
    }
    if (!profile.mountpoint.starts_with('/') || profile.mountpoint == "/"sv) {
        spdlog::error("Invalid target mountpoint '{}'", profile.mountpoint);
        return false;
    }
    if (profile.base_install_attempts < 1) {
        spdlog::error("base_install_attempts must be at least 1, got {}", profile.base_install_attempts);
        return false;
    }
    if (profile.boot_timeout < 0) {
        spdlog::error("boot_timeout must not be negative, got {}", profile.boot_timeout);
        return false;
    }
    for (const auto& repo : profile.repositories) {
        if (repo.name.empty() || repo.server.empty()) {
            spdlog::error("Repository entries need both name and server");
            return false;
        }
    }
    for (const auto& user : profile.users) {
        if (!is_valid_username(user.name)) {
            spdlog::error("Invalid user name '{}'", user.name);
            return false;
        }
        if (user.password_hash.empty()) {
            spdlog::error("User '{}' has no password hash", user.name);
            return false;
        }
        for (const auto& file : user.files) {
            if (file.destination.starts_with('/') || file.destination.contains(".."sv)) {
                spdlog::error("Destination '{}' of '{}' must stay inside the home directory", file.destination, user.name);
                return false;
            }
        }
    }
    return true;
}

auto find_profile_path() noexcept -> std::optional<std::string> {
    if (const auto& env_path = autoinst::utils::safe_getenv("AUTOINST_PROFILE"); !env_path.empty()) {
        if (!fs::exists(env_path)) {
            spdlog::error("Profile '{}' from AUTOINST_PROFILE doesn't exist", env_path);
            return std::nullopt;
        }
        return std::string{env_path};
    }
    for (const auto& profile_path : DEFAULT_PROFILE_PATHS) {
        if (fs::exists(profile_path)) {
            return std::string{profile_path};
        }
    }
    spdlog::error("No install profile found");
    return std::nullopt;
}

auto load_install_profile(std::string_view profile_path) noexcept -> std::optional<InstallProfile> {
    if (!fs::exists(profile_path)) {
        spdlog::error("Profile '{}' doesn't exist", profile_path);
        return std::nullopt;
    }
    const auto& profile_content = autoinst::file_utils::read_whole_file(profile_path);
    auto profile                = parse_install_profile(profile_content);
    if (!profile.has_value() || !validate_install_profile(*profile)) {
        spdlog::error("Profile '{}' is invalid", profile_path);
        return std::nullopt;
    }
    spdlog::info("Loaded install profile from {}", profile_path);
    return profile;
}

}  // namespace installer
