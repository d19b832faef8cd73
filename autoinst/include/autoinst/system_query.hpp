#ifndef AUTOINST_SYSTEM_QUERY_HPP
#define AUTOINST_SYSTEM_QUERY_HPP

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::disk {

/// @brief Transport type for storage devices
enum class DiskTransport : std::uint8_t {
    Sata,
    Nvme,
    Usb,
    Scsi,
    Virtio,
    Unknown
};

/// @brief Information about a partition on a disk
struct PartitionInfo final {
    /// Partition device path
    std::string device;
    /// Filesystem type
    std::string fstype;
    /// Filesystem UUID
    std::optional<std::string> uuid;
    /// Partition UUID
    std::optional<std::string> partuuid;
    /// Partition size in bytes
    std::uint64_t size{0};
    /// Mountpoint if mounted
    std::optional<std::string> mountpoint;
    /// Whether the partition is currently mounted
    bool is_mounted{false};
};

/// @brief Information about a disk device
struct DiskInfo final {
    /// Disk device path
    std::string device;
    /// Disk model name
    std::optional<std::string> model;
    /// Total disk size in bytes
    std::uint64_t size{0};
    /// Transport type
    DiskTransport transport{DiskTransport::Unknown};
    /// Whether the disk reports itself as rotational
    bool is_rotational{true};
    /// Whether the disk is removable
    bool is_removable{false};
    /// Whether the disk is read-only
    bool is_read_only{false};
    /// Mountpoint if the whole disk is mounted (e.g. iso9660 media)
    std::optional<std::string> mountpoint;
    /// List of partitions on this disk
    std::vector<PartitionInfo> partitions;
};

/// @brief Convert disk transport enum to string representation
/// @param transport The transport type to convert
/// @return string view of the transport type
auto disk_transport_to_string(DiskTransport transport) noexcept -> std::string_view;

/// @brief Convert transport string to disk transport enum
/// @param transport_str The transport string
/// @return disk transport enum value
auto string_to_disk_transport(std::string_view transport_str) noexcept -> DiskTransport;

/// @brief Lists all disk devices (excluding partitions and virtual devices)
/// @return Optional vector of DiskInfo, std::nullopt on failure
auto list_disks() noexcept -> std::optional<std::vector<DiskInfo>>;

/// @brief Parses JSON output from lsblk command into DiskInfo structures
/// @param json_output The JSON string from lsblk -J command
/// @return vector of DiskInfo, empty on error
auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo>;

/// @brief Formats a size in bytes to human-readable string
/// @param bytes Size in bytes
/// @return Human-readable size string
auto format_size(std::uint64_t bytes) noexcept -> std::string;

/// @brief Parses disk name(base) from device
/// @param device The device path
/// @return extracted disk name of the device
auto get_disk_name_from_device(std::string_view device) noexcept -> std::string_view;

/// @brief Builds the device path of the n-th partition of a disk
/// @param disk_device The disk device path (e.g. /dev/sda, /dev/nvme0n1)
/// @param part_number Partition number, starting at 1
/// @return partition path (e.g. /dev/sda1, /dev/nvme0n1p1)
auto make_partition_device(std::string_view disk_device, std::uint32_t part_number) noexcept -> std::string;

}  // namespace autoinst::disk

#endif  // AUTOINST_SYSTEM_QUERY_HPP
