#ifndef AUTOINST_BOOTLOADER_HPP
#define AUTOINST_BOOTLOADER_HPP

#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::bootloader {

struct LoaderConfig final {
    // e.g default arch-linux.conf
    std::string default_entry{};
    // e.g timeout 15
    std::int32_t timeout{15};
};

// Boot Loader Specification type #1 entry
struct BootEntry final {
    std::string title{};
    // paths are relative to the ESP root
    std::string linux_path{};
    std::vector<std::string> initrd_paths{};
    std::string options{};
};

struct SystemdBootInstallConfig final {
    std::string_view root_mountpoint;
    // ESP mountpoint inside the target
    std::string_view boot_mountpoint;
    std::string_view kernel;
    std::string_view root_partuuid;
    std::int32_t timeout{15};
};

// Generate loader.conf into string
auto gen_loader_conf(const LoaderConfig& loader_config) noexcept -> std::string;

// Generate boot entry into string
auto gen_boot_entry(const BootEntry& boot_entry) noexcept -> std::string;

// Generate default and fallback entries for the kernel
auto gen_kernel_entries(std::string_view kernel, std::string_view root_partuuid) noexcept -> std::vector<BootEntry>;

// Writes loader.conf and entries into {root_mountpoint}{boot_mountpoint}/loader
auto write_systemd_boot_config(const SystemdBootInstallConfig& install_config) noexcept -> bool;

// Installs & configures systemd-boot on system
auto install_systemd_boot(const SystemdBootInstallConfig& install_config) noexcept -> bool;

}  // namespace autoinst::bootloader

#endif  // AUTOINST_BOOTLOADER_HPP
