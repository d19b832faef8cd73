#ifndef CONFIG_APPLIER_HPP
#define CONFIG_APPLIER_HPP

#include "install_profile.hpp"

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace installer {

/// Sub-steps in the order they are applied.
/// Accounts have to exist before per-user settings are written.
enum class ApplyStep : std::uint8_t {
    HostnameLocale,
    Accounts,
    Services,
    Repositories,
    UserSettings
};

struct ApplyReport final {
    std::vector<ApplyStep> applied{};
    std::optional<ApplyStep> failed_step{};

    [[nodiscard]] auto succeeded() const noexcept -> bool { return !failed_step.has_value(); }
    /// e.g "applied: hostname-locale, accounts; failed: services"
    [[nodiscard]] auto summary() const noexcept -> std::string;
};

[[nodiscard]] auto apply_step_to_string(ApplyStep step) noexcept -> std::string_view;

// Each step can be re-applied onto already configured root without changing it.
auto apply_hostname_locale(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool;
auto apply_accounts(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool;
auto apply_services(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool;
auto apply_repositories(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool;
auto apply_user_settings(const InstallProfile& profile, std::string_view mountpoint) noexcept -> bool;

/// Applies the whole profile onto the target root, stopping at the first failed step.
auto apply_config(const InstallProfile& profile, std::string_view mountpoint) noexcept -> ApplyReport;

/// Commands run as the user to apply desktop settings and extensions.
[[nodiscard]] auto gen_desktop_commands(const UserProfile& user) noexcept -> std::vector<std::string>;

}  // namespace installer

#endif  // CONFIG_APPLIER_HPP
