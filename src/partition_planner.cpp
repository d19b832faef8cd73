#include "partition_planner.hpp"

// import autoinst
#include "autoinst/system_query.hpp"

#include <algorithm>  // for find_if
#include <numeric>    // for accumulate
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace installer {

auto partition_role_to_string(PartitionRole role) noexcept -> std::string_view {
    switch (role) {
    case PartitionRole::Esp:
        return "ESP"sv;
    case PartitionRole::Root:
        return "root"sv;
    }
    return "unknown"sv;
}

auto plan_partitions(std::string_view device, std::uint64_t capacity) noexcept -> std::optional<PartitionPlan> {
    if (capacity < minimum_capacity()) {
        spdlog::error("Insufficient capacity on {}: {} bytes available, at least {} bytes required", device, capacity, minimum_capacity());
        return std::nullopt;
    }

    // whole MiB only, the tail is left unused
    const auto capacity_mib  = capacity / MiB;
    const auto root_size_mib = capacity_mib - ALIGNMENT_GAP_MIB - ESP_SIZE_MIB - END_RESERVE_MIB;

    PartitionPlan plan{.device = std::string{device}, .capacity = capacity};
    plan.partitions.emplace_back(PartitionSpec{
        .role         = PartitionRole::Esp,
        .offset       = ALIGNMENT_GAP_MIB * MiB,
        .size         = ESP_SIZE_MIB * MiB,
        .is_remainder = false,
        .fstype       = autoinst::fs::FilesystemType::Vfat,
        .mountpoint   = "/boot",
        .device       = autoinst::disk::make_partition_device(device, 1),
    });
    plan.partitions.emplace_back(PartitionSpec{
        .role         = PartitionRole::Root,
        .offset       = (ALIGNMENT_GAP_MIB + ESP_SIZE_MIB) * MiB,
        .size         = root_size_mib * MiB,
        .is_remainder = true,
        .fstype       = autoinst::fs::FilesystemType::Ext4,
        .mountpoint   = "/",
        .device       = autoinst::disk::make_partition_device(device, 2),
    });

    spdlog::info("Planned {} on {}: ESP {}MiB, root {}MiB", plan.partitions.size(), device, ESP_SIZE_MIB, root_size_mib);
    return std::make_optional<PartitionPlan>(std::move(plan));
}

auto planned_size(const PartitionPlan& plan) noexcept -> std::uint64_t {
    return std::accumulate(plan.partitions.begin(), plan.partitions.end(), std::uint64_t{0},
        [](std::uint64_t total, const PartitionSpec& part) { return total + part.size; });
}

auto to_partition_schema(const PartitionPlan& plan) noexcept -> std::vector<autoinst::fs::Partition> {
    std::vector<autoinst::fs::Partition> partitions{};
    partitions.reserve(plan.partitions.size());
    for (const auto& part : plan.partitions) {
        partitions.emplace_back(autoinst::fs::Partition{
            .fstype     = part.fstype,
            .mountpoint = part.mountpoint,
            .device     = part.device,
            .size       = fmt::format(FMT_COMPILE("{}MiB"), part.size / MiB),
            .start      = fmt::format(FMT_COMPILE("{}MiB"), part.offset / MiB),
        });
    }
    return partitions;
}

auto find_partition(const PartitionPlan& plan, PartitionRole role) noexcept -> std::optional<PartitionSpec> {
    const auto& part_it = std::ranges::find_if(plan.partitions, [role](auto&& part) { return part.role == role; });
    if (part_it == plan.partitions.end()) {
        return std::nullopt;
    }
    return *part_it;
}

}  // namespace installer
