#ifndef INSTALL_PROFILE_HPP
#define INSTALL_PROFILE_HPP

#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

// import autoinst
#include "autoinst/repos.hpp"

namespace installer {

/// File copied from the live image into the user's home.
struct UserFile final {
    std::string source{};
    /// relative to the home directory
    std::string destination{};

    bool operator==(const UserFile&) const = default;
};

/// Single gsettings key.
struct DesktopSetting final {
    std::string schema{};
    std::string key{};
    /// GVariant text, passed to gsettings as is
    std::string value{};

    bool operator==(const DesktopSetting&) const = default;
};

struct UserProfile final {
    std::string name{};
    std::string password_hash{};
    std::string shell{"/bin/bash"};
    std::vector<std::string> groups{};
    bool sudo{};

    std::string git_name{};
    std::string git_email{};
    /// run as the user inside the target
    std::vector<std::string> commands{};
    std::vector<UserFile> files{};
    std::vector<DesktopSetting> settings{};
    /// gnome-shell extension uuids
    std::vector<std::string> extensions{};

    bool operator==(const UserProfile&) const = default;
};

/// Everything the installed system is configured with.
/// Loaded once, never modified afterwards.
struct InstallProfile final {
    // [system]
    std::string hostname{};
    std::string locale{"en_US.UTF-8"};
    std::string keymap{"us"};
    std::string kernel{"linux"};

    std::vector<std::string> packages{};
    std::vector<std::string> services{};

    std::vector<autoinst::repos::CustomRepo> repositories{};
    bool multilib{};

    std::string root_password_hash{};
    std::vector<UserProfile> users{};

    // [installer]
    std::string mountpoint{"/mnt/arch"};
    std::int32_t base_install_attempts{3};
    std::int32_t boot_timeout{15};

    bool operator==(const InstallProfile&) const = default;
};

/// Parses profile from TOML document.
/// @return std::nullopt if document is malformed or misses required keys.
[[nodiscard]] auto parse_install_profile(std::string_view profile_content) noexcept -> std::optional<InstallProfile>;

/// Checks values which TOML types alone can't express.
[[nodiscard]] auto validate_install_profile(const InstallProfile& profile) noexcept -> bool;

[[nodiscard]] auto is_valid_hostname(std::string_view hostname) noexcept -> bool;
[[nodiscard]] auto is_valid_username(std::string_view username) noexcept -> bool;

/// Locates the profile: AUTOINST_PROFILE, /etc/autoinst/profile.toml,
/// /usr/share/autoinst/profile.toml, first existing one wins.
[[nodiscard]] auto find_profile_path() noexcept -> std::optional<std::string>;

/// Reads, parses and validates profile at path.
[[nodiscard]] auto load_install_profile(std::string_view profile_path) noexcept -> std::optional<InstallProfile>;

}  // namespace installer

#endif  // INSTALL_PROFILE_HPP
