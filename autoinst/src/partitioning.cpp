#include "autoinst/partitioning.hpp"
#include "autoinst/io_utils.hpp"
#include "autoinst/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_literals;

namespace autoinst::disk {

auto gen_sfdisk_command(const std::vector<fs::Partition>& partitions) noexcept -> std::string {
    // sfdisk does not create partition table without partitions by default. The lines with partitions are expected in the script by default.
    std::string sfdisk_commands{"label: gpt\n"s};

    for (const auto& part : partitions) {
        // L - alias 'linux'. Linux
        // U - alias 'uefi'. EFI System partition
        sfdisk_commands += fmt::format(FMT_COMPILE("type={}"), fs::get_sfdisk_type_alias(part.fstype));

        if (!part.start.empty()) {
            sfdisk_commands += fmt::format(FMT_COMPILE(",start={}"), part.start);
        }

        // A size followed by a multiplicative suffix (KiB, MiB, GiB, ...) is
        // interpreted as bytes and aligned according to the device I/O limits.
        // Without size= the partition takes everything up to the end of the device.
        if (!part.size.empty()) {
            sfdisk_commands += fmt::format(FMT_COMPILE(",size={}"), part.size);
        }
        sfdisk_commands += "\n"s;
    }
    return sfdisk_commands;
}

auto run_sfdisk_part(std::string_view commands, std::string_view device) noexcept -> bool {
    const auto& sfdisk_cmd = fmt::format(FMT_COMPILE("printf '%s' {} | sfdisk -w always '{}' >>/tmp/autoinst-install.log 2>&1"), utils::shell_quote(commands), device);
    if (!utils::exec_checked(sfdisk_cmd)) {
        spdlog::error("Failed to run partitioning with sfdisk: {}", sfdisk_cmd);
        return false;
    }
    return true;
}

auto erase_disk(std::string_view device) noexcept -> bool {
    // 1. write zeros
    const auto& dd_cmd = fmt::format(FMT_COMPILE("dd if=/dev/zero of='{}' bs=512 count=1 >>/tmp/autoinst-install.log 2>&1"), device);
    if (!utils::exec_checked(dd_cmd)) {
        spdlog::error("Failed to run dd on disk: {}", dd_cmd);
        return false;
    }
    // 2. run wipefs on disk
    const auto& wipe_cmd = fmt::format(FMT_COMPILE("wipefs -af '{}' >>/tmp/autoinst-install.log 2>&1"), device);
    if (!utils::exec_checked(wipe_cmd)) {
        spdlog::error("Failed to run wipefs on disk: {}", wipe_cmd);
        return false;
    }
    // 3. clear all data and destroy GPT data structures
    const auto& sgdisk_cmd = fmt::format(FMT_COMPILE("sgdisk -Zo '{}' >>/tmp/autoinst-install.log 2>&1"), device);
    if (!utils::exec_checked(sgdisk_cmd)) {
        spdlog::error("Failed to run sgdisk on disk: {}", sgdisk_cmd);
        return false;
    }

    return true;
}

auto make_clean_partschema(std::string_view device, const std::vector<fs::Partition>& partitions) noexcept -> bool {
    // clear disk
    if (!erase_disk(device)) {
        spdlog::error("Failed to erase disk: {}", device);
        return false;
    }
    // apply schema
    const auto& sfdisk_commands = disk::gen_sfdisk_command(partitions);
    if (!run_sfdisk_part(sfdisk_commands, device)) {
        spdlog::error("Failed to apply partition schema with sfdisk");
        return false;
    }
    // let the kernel pick up the new table before anything opens the partitions
    if (!utils::exec_checked(fmt::format(FMT_COMPILE("partprobe '{}' >>/tmp/autoinst-install.log 2>&1"), device))) {
        spdlog::warn("partprobe failed on {}, relying on sfdisk re-read", device);
    }
    return true;
}

}  // namespace autoinst::disk
