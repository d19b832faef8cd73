#ifndef AUTOINST_PARTITIONING_HPP
#define AUTOINST_PARTITIONING_HPP

#include "autoinst/partition.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::disk {

// Generates sfdisk script for a GPT label from Partition scheme.
// Partitions are written in the given order.
auto gen_sfdisk_command(const std::vector<fs::Partition>& partitions) noexcept -> std::string;

// Runs disk partitioning using sfdisk command on device
auto run_sfdisk_part(std::string_view commands, std::string_view device) noexcept -> bool;

// Wipes the first sector, filesystem signatures and GPT structures of device
auto erase_disk(std::string_view device) noexcept -> bool;

// Erases device and applies the partition scheme to it
auto make_clean_partschema(std::string_view device, const std::vector<fs::Partition>& partitions) noexcept -> bool;

}  // namespace autoinst::disk

#endif  // AUTOINST_PARTITIONING_HPP
