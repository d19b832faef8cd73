#include "preflight.hpp"
#include "definitions.hpp"

// import autoinst
#include "autoinst/mtab.hpp"

#include <unistd.h>  // for geteuid

#include <algorithm>   // for any_of
#include <filesystem>  // for exists

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace {

constexpr auto EFI_FIRMWARE_DIR = "/sys/firmware/efi"sv;
constexpr auto EFIVARS_DIR      = "/sys/firmware/efi/efivars"sv;

}  // namespace

namespace installer {

auto has_efivarfs_mount(std::string_view mtab_content) noexcept -> bool {
    const auto& mtab_entries = autoinst::mtab::parse_mtab_content(mtab_content, EFIVARS_DIR);
    return std::ranges::any_of(mtab_entries, [](auto&& entry) {
        return entry.mountpoint == EFIVARS_DIR && entry.fstype == "efivarfs"sv;
    });
}

auto is_uefi_environment(std::string_view firmware_dir, std::string_view mtab_content) noexcept -> bool {
    if (!fs::exists(firmware_dir)) {
        spdlog::error("{} doesn't exist, system is not booted in UEFI mode", firmware_dir);
        return false;
    }
    if (!has_efivarfs_mount(mtab_content)) {
        spdlog::error("efivarfs is not mounted at {}", EFIVARS_DIR);
        return false;
    }
    return true;
}

auto run_preflight_checks() noexcept -> bool {
    if (geteuid() != 0) {
        error_inter("The installer must be run as root.\n");
        spdlog::error("Not running as root");
        return false;
    }

    const auto& mtab_content = autoinst::mtab::read_mtab();
    if (!mtab_content || !is_uefi_environment(EFI_FIRMWARE_DIR, *mtab_content)) {
        error_inter("UEFI firmware is required, legacy BIOS systems are not supported.\n");
        return false;
    }
    spdlog::info("Preflight checks passed");
    return true;
}

}  // namespace installer
