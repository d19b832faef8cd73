#include "autoinst/bootloader.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// entry file name is its id, e.g linux.conf -> linux
auto entry_filename(std::string_view kernel, bool is_fallback) noexcept -> std::string {
    if (is_fallback) {
        return fmt::format(FMT_COMPILE("{}-fallback.conf"), kernel);
    }
    return fmt::format(FMT_COMPILE("{}.conf"), kernel);
}

}  // namespace

namespace autoinst::bootloader {

auto gen_loader_conf(const LoaderConfig& loader_config) noexcept -> std::string {
    std::string result{};
    if (!loader_config.default_entry.empty()) {
        result += fmt::format(FMT_COMPILE("default {}\n"), loader_config.default_entry);
    }
    result += fmt::format(FMT_COMPILE("timeout {}\n"), loader_config.timeout);
    return result;
}

auto gen_boot_entry(const BootEntry& boot_entry) noexcept -> std::string {
    std::string result = fmt::format(FMT_COMPILE("title   {}\nlinux   {}\n"), boot_entry.title, boot_entry.linux_path);
    for (auto&& initrd : boot_entry.initrd_paths) {
        result += fmt::format(FMT_COMPILE("initrd  {}\n"), initrd);
    }
    result += fmt::format(FMT_COMPILE("options {}\n"), boot_entry.options);
    return result;
}

auto gen_kernel_entries(std::string_view kernel, std::string_view root_partuuid) noexcept -> std::vector<BootEntry> {
    const auto& options = fmt::format(FMT_COMPILE("root=PARTUUID={} rw"), root_partuuid);
    return {
        BootEntry{
            .title        = fmt::format(FMT_COMPILE("Arch Linux ({})"), kernel),
            .linux_path   = fmt::format(FMT_COMPILE("/vmlinuz-{}"), kernel),
            .initrd_paths = {fmt::format(FMT_COMPILE("/initramfs-{}.img"), kernel)},
            .options      = options,
        },
        BootEntry{
            .title        = fmt::format(FMT_COMPILE("Arch Linux ({}, fallback initramfs)"), kernel),
            .linux_path   = fmt::format(FMT_COMPILE("/vmlinuz-{}"), kernel),
            .initrd_paths = {fmt::format(FMT_COMPILE("/initramfs-{}-fallback.img"), kernel)},
            .options      = options,
        },
    };
}

auto write_systemd_boot_config(const SystemdBootInstallConfig& install_config) noexcept -> bool {
    const auto& loader_dir = fmt::format(FMT_COMPILE("{}{}/loader"), install_config.root_mountpoint, install_config.boot_mountpoint);

    const auto& entries = bootloader::gen_kernel_entries(install_config.kernel, install_config.root_partuuid);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry_path = fmt::format(FMT_COMPILE("{}/entries/{}"), loader_dir, entry_filename(install_config.kernel, i != 0));
        if (!file_utils::create_file_for_overwrite(entry_path, bootloader::gen_boot_entry(entries[i]))) {
            spdlog::error("Failed to open boot entry for writing {}", entry_path);
            return false;
        }
    }

    const LoaderConfig loader_config{
        .default_entry = entry_filename(install_config.kernel, false),
        .timeout       = install_config.timeout,
    };
    const auto& loader_conf_path = fmt::format(FMT_COMPILE("{}/loader.conf"), loader_dir);
    if (!file_utils::create_file_for_overwrite(loader_conf_path, bootloader::gen_loader_conf(loader_config))) {
        spdlog::error("Failed to open loader config for writing {}", loader_conf_path);
        return false;
    }
    return true;
}

auto install_systemd_boot(const SystemdBootInstallConfig& install_config) noexcept -> bool {
    if (install_config.root_partuuid.empty()) {
        spdlog::error("Cannot install systemd-boot without root PARTUUID");
        return false;
    }

    // Install systemd-boot onto EFI
    const auto& bootctl_cmd = fmt::format(FMT_COMPILE("bootctl --esp-path={} install"), install_config.boot_mountpoint);
    if (!utils::arch_chroot_checked(bootctl_cmd, install_config.root_mountpoint)) {
        // bootctl treats arch-chroot as a container and may fail writing EFI variables
        spdlog::warn("bootctl install failed, retrying without touching EFI variables");
        const auto& bootctl_novars_cmd = fmt::format(FMT_COMPILE("bootctl --esp-path={} --variables=no install"), install_config.boot_mountpoint);
        if (!utils::arch_chroot_checked(bootctl_novars_cmd, install_config.root_mountpoint)) {
            spdlog::error("Failed to run bootctl on path {} with: {}", install_config.root_mountpoint, bootctl_novars_cmd);
            return false;
        }
    }

    if (!bootloader::write_systemd_boot_config(install_config)) {
        spdlog::error("Failed to write systemd-boot configuration");
        return false;
    }
    return true;
}

}  // namespace autoinst::bootloader
