#ifndef AUTOINST_PARTITION_HPP
#define AUTOINST_PARTITION_HPP

#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::fs {

/// @brief Filesystem types the installer knows how to create
enum class FilesystemType : std::uint8_t {
    Ext4,
    Vfat,
    Unknown
};

struct Partition final {
    FilesystemType fstype{FilesystemType::Unknown};
    std::string mountpoint{};
    std::string device{};

    // size as understood by sfdisk (e.g "1024MiB"),
    // empty means the partition takes the rest of the device
    std::string size{};

    // start as understood by sfdisk, empty lets sfdisk align it
    std::string start{};

    constexpr bool operator==(const Partition&) const = default;
};

/// @brief Convert FilesystemType enum to string representation
auto filesystem_type_to_string(FilesystemType fs_type) noexcept -> std::string_view;

/// @brief Convert string to FilesystemType enum
/// @return FilesystemType enum value (Unknown if not recognized)
auto string_to_filesystem_type(std::string_view fs_name) noexcept -> FilesystemType;

/// @brief Get the mkfs command for a filesystem type
/// @return The mkfs command string (e.g., "mkfs.ext4 -F"), empty if unsupported
auto get_mkfs_command(FilesystemType fs_type) noexcept -> std::string_view;

/// @brief Get the sfdisk partition type alias for a filesystem
/// @return The sfdisk type alias (L=Linux, U=UEFI)
auto get_sfdisk_type_alias(FilesystemType fs_type) noexcept -> std::string_view;

}  // namespace autoinst::fs

#endif  // AUTOINST_PARTITION_HPP
