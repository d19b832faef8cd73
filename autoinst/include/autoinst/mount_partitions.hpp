#ifndef AUTOINST_MOUNT_PARTITIONS_HPP
#define AUTOINST_MOUNT_PARTITIONS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::mount {

// Builds mount command, its output goes to the install log
auto gen_mount_command(std::string_view partition, std::string_view mount_dir, std::string_view mount_opts = {}) noexcept -> std::string;

// Mount partition, creating mount_dir if missing
auto mount_partition(std::string_view partition, std::string_view mount_dir, std::string_view mount_opts = {}) noexcept -> bool;

// Umount single mountpoint
auto umount_mountpoint(std::string_view mount_dir) noexcept -> bool;

}  // namespace autoinst::mount

#endif  // AUTOINST_MOUNT_PARTITIONS_HPP
