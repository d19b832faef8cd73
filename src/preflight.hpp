#ifndef PREFLIGHT_HPP
#define PREFLIGHT_HPP

#include <string_view>  // for string_view

namespace installer {

/// Whether efivarfs shows up in mtab content.
[[nodiscard]] auto has_efivarfs_mount(std::string_view mtab_content) noexcept -> bool;

/// Firmware is UEFI when firmware_dir exists and efivarfs is mounted.
[[nodiscard]] auto is_uefi_environment(std::string_view firmware_dir, std::string_view mtab_content) noexcept -> bool;

/// Checks that nothing prevents a bootable install before anything gets touched:
/// root privileges and UEFI firmware.
auto run_preflight_checks() noexcept -> bool;

}  // namespace installer

#endif  // PREFLIGHT_HPP
