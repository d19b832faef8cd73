#ifndef AUTOINST_FS_UTILS_HPP
#define AUTOINST_FS_UTILS_HPP

#include "autoinst/partition.hpp"

#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::fs::utils {

// Creates filesystem of the partition's type on its device
auto format_partition(const Partition& partition) noexcept -> bool;

// Get PARTUUID of device/partition
auto get_device_partuuid(std::string_view device) noexcept -> std::string;

}  // namespace autoinst::fs::utils

#endif  // AUTOINST_FS_UTILS_HPP
