#ifndef BLOCK_DEVICE_HPP
#define BLOCK_DEVICE_HPP

#include <cstdint>      // for uint64_t, uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

// import autoinst
#include "autoinst/system_query.hpp"

namespace installer {

/// How the device is attached, as far as target ranking is concerned.
enum class TransportClass : std::uint8_t {
    Nvme,
    /// any non-rotational disk which is not NVMe
    SataSsd,
    Rotational,
    Other
};

/// Snapshot of a single block device.
struct BlockDevice final {
    std::string path{};
    TransportClass transport_class{TransportClass::Other};
    std::uint64_t capacity{};
    bool removable{};
    bool read_only{};
    // display only
    std::string model{};
    std::string transport_name{};

    bool operator==(const BlockDevice&) const = default;
};

/// Immutable list of block devices, taken once per run.
using DeviceInventory = std::vector<BlockDevice>;

[[nodiscard]] auto transport_class_to_string(TransportClass transport_class) noexcept -> std::string_view;

/// Maps what lsblk reports onto the ranking classes.
[[nodiscard]] auto classify_transport(const autoinst::disk::DiskInfo& disk) noexcept -> TransportClass;

/// Builds inventory from parsed lsblk disks.
[[nodiscard]] auto make_inventory(const std::vector<autoinst::disk::DiskInfo>& disks) noexcept -> DeviceInventory;

/// Takes inventory of the running system.
/// @return std::nullopt if block devices couldn't be listed.
[[nodiscard]] auto snapshot_inventory() noexcept -> std::optional<DeviceInventory>;

/// Finds the disk the live image was booted from.
/// @param mtab_content Content of /etc/mtab.
/// @return Disk path (e.g /dev/sdb), std::nullopt if the medium isn't mounted.
[[nodiscard]] auto detect_boot_medium(std::string_view mtab_content) noexcept -> std::optional<std::string>;

/// Same as detect_boot_medium, reading /etc/mtab of the running system.
[[nodiscard]] auto find_boot_medium() noexcept -> std::optional<std::string>;

}  // namespace installer

#endif  // BLOCK_DEVICE_HPP
