#ifndef PARTITION_PLANNER_HPP
#define PARTITION_PLANNER_HPP

#include <cstdint>      // for uint64_t, uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

// import autoinst
#include "autoinst/partition.hpp"

namespace installer {

inline constexpr std::uint64_t MiB = 1024ULL * 1024ULL;

inline constexpr std::uint64_t ESP_SIZE_MIB      = 1024;
inline constexpr std::uint64_t MIN_ROOT_SIZE_MIB = 4096;
// leading gap for alignment, trailing one for the backup GPT header
inline constexpr std::uint64_t ALIGNMENT_GAP_MIB = 1;
inline constexpr std::uint64_t END_RESERVE_MIB   = 1;

enum class PartitionRole : std::uint8_t {
    Esp,
    Root
};

struct PartitionSpec final {
    PartitionRole role{};
    std::uint64_t offset{};
    std::uint64_t size{};
    /// root takes whatever is left after the ESP
    bool is_remainder{};
    autoinst::fs::FilesystemType fstype{autoinst::fs::FilesystemType::Unknown};
    std::string mountpoint{};
    /// device node the partition receives (e.g /dev/nvme0n1p2)
    std::string device{};

    bool operator==(const PartitionSpec&) const = default;
};

struct PartitionPlan final {
    std::string device{};
    std::uint64_t capacity{};
    /// ordered as written to the partition table, ESP first
    std::vector<PartitionSpec> partitions{};

    bool operator==(const PartitionPlan&) const = default;
};

[[nodiscard]] auto partition_role_to_string(PartitionRole role) noexcept -> std::string_view;

/// Smallest device capacity in bytes a plan can be made for.
[[nodiscard]] constexpr auto minimum_capacity() noexcept -> std::uint64_t {
    return (ALIGNMENT_GAP_MIB + ESP_SIZE_MIB + MIN_ROOT_SIZE_MIB + END_RESERVE_MIB) * MiB;
}

/// Builds the layout for a device of given capacity: FAT32 ESP at /boot,
/// followed by ext4 root at / spanning the rest of the device.
/// @return std::nullopt on insufficient capacity.
[[nodiscard]] auto plan_partitions(std::string_view device, std::uint64_t capacity) noexcept -> std::optional<PartitionPlan>;

/// Sum of all partition sizes in bytes.
[[nodiscard]] auto planned_size(const PartitionPlan& plan) noexcept -> std::uint64_t;

/// Converts plan into the partition schema understood by sfdisk helpers.
[[nodiscard]] auto to_partition_schema(const PartitionPlan& plan) noexcept -> std::vector<autoinst::fs::Partition>;

/// Finds partition of given role in the plan.
[[nodiscard]] auto find_partition(const PartitionPlan& plan, PartitionRole role) noexcept -> std::optional<PartitionSpec>;

}  // namespace installer

#endif  // PARTITION_PLANNER_HPP
