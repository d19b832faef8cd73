#include "block_device.hpp"

// import autoinst
#include "autoinst/mtab.hpp"

#include <algorithm>   // for find
#include <filesystem>  // for canonical
#include <utility>     // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// archiso mounts the boot medium here
static constexpr auto ARCHISO_BOOTMNT = "/run/archiso/bootmnt"sv;

auto disk_of_partition(std::string_view source) noexcept -> std::optional<std::string> {
    if (!source.starts_with("/dev/"sv)) {
        return std::nullopt;
    }
    return fmt::format(FMT_COMPILE("/dev/{}"), autoinst::disk::get_disk_name_from_device(source));
}

}  // namespace

namespace installer {

auto transport_class_to_string(TransportClass transport_class) noexcept -> std::string_view {
    switch (transport_class) {
    case TransportClass::Nvme:
        return "NVMe"sv;
    case TransportClass::SataSsd:
        return "SSD"sv;
    case TransportClass::Rotational:
        return "HDD"sv;
    case TransportClass::Other:
    default:
        return "other"sv;
    }
}

auto classify_transport(const autoinst::disk::DiskInfo& disk) noexcept -> TransportClass {
    using autoinst::disk::DiskTransport;

    if (disk.transport == DiskTransport::Nvme) {
        return TransportClass::Nvme;
    }
    if (!disk.is_rotational) {
        return TransportClass::SataSsd;
    }
    // spinning disk behind a known bus
    if (disk.transport == DiskTransport::Sata || disk.transport == DiskTransport::Scsi) {
        return TransportClass::Rotational;
    }
    return TransportClass::Other;
}

auto make_inventory(const std::vector<autoinst::disk::DiskInfo>& disks) noexcept -> DeviceInventory {
    DeviceInventory inventory{};
    inventory.reserve(disks.size());
    for (auto&& disk : disks) {
        inventory.emplace_back(BlockDevice{
            .path            = disk.device,
            .transport_class = classify_transport(disk),
            .capacity        = disk.size,
            .removable       = disk.is_removable,
            .read_only       = disk.is_read_only,
            .model           = disk.model.value_or(""),
            .transport_name  = std::string{autoinst::disk::disk_transport_to_string(disk.transport)},
        });
    }
    return inventory;
}

auto snapshot_inventory() noexcept -> std::optional<DeviceInventory> {
    auto disks = autoinst::disk::list_disks();
    if (!disks) {
        spdlog::error("Failed to list block devices");
        return std::nullopt;
    }
    auto inventory = make_inventory(*disks);
    for (auto&& device : inventory) {
        spdlog::info("Found {} ({}, {}, removable: {}, model: '{}')", device.path, transport_class_to_string(device.transport_class),
            autoinst::disk::format_size(device.capacity), device.removable, device.model);
    }
    return std::make_optional<DeviceInventory>(std::move(inventory));
}

auto detect_boot_medium(std::string_view mtab_content) noexcept -> std::optional<std::string> {
    const auto& source = autoinst::mtab::find_mountpoint_source(mtab_content, ARCHISO_BOOTMNT);
    if (!source) {
        return std::nullopt;
    }
    return disk_of_partition(*source);
}

auto find_boot_medium() noexcept -> std::optional<std::string> {
    const auto& mtab_entries = autoinst::mtab::parse_mtab(ARCHISO_BOOTMNT);
    if (!mtab_entries) {
        spdlog::error("Failed to parse /etc/mtab");
        return std::nullopt;
    }

    const auto& bootmnt_entry = std::ranges::find(*mtab_entries, ARCHISO_BOOTMNT, &autoinst::mtab::MTabEntry::mountpoint);
    if (bootmnt_entry == mtab_entries->end()) {
        spdlog::info("Boot medium is not mounted at {}", ARCHISO_BOOTMNT);
        return std::nullopt;
    }

    // by-label/by-uuid links point at the real partition
    std::error_code err{};
    const auto& source = fs::canonical(fs::path{bootmnt_entry->device}, err);
    if (err) {
        spdlog::warn("Failed to resolve boot medium source {}: {}", bootmnt_entry->device, err.message());
    }

    auto boot_medium = disk_of_partition(err ? bootmnt_entry->device : source.string());
    if (boot_medium) {
        spdlog::info("Live boot medium is {}", *boot_medium);
    }
    return boot_medium;
}

}  // namespace installer
