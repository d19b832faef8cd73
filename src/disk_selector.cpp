#include "disk_selector.hpp"

#include <algorithm>  // for min_element
#include <vector>     // for vector

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto tier_reason(installer::SelectionTier tier) noexcept -> std::string_view {
    switch (tier) {
    case installer::SelectionTier::Nvme:
        return "NVMe drive"sv;
    case installer::SelectionTier::Ssd:
        return "SSD (non-rotational) drive"sv;
    case installer::SelectionTier::Other:
    default:
        return "largest available disk"sv;
    }
}

}  // namespace

namespace installer {

auto selection_tier(const BlockDevice& device) noexcept -> SelectionTier {
    switch (device.transport_class) {
    case TransportClass::Nvme:
        return SelectionTier::Nvme;
    case TransportClass::SataSsd:
        return SelectionTier::Ssd;
    case TransportClass::Rotational:
    case TransportClass::Other:
    default:
        return SelectionTier::Other;
    }
}

auto is_eligible(const BlockDevice& device, const std::optional<std::string>& boot_medium) noexcept -> bool {
    if (boot_medium && device.path == *boot_medium) {
        spdlog::info("Skipping {}: live boot medium", device.path);
        return false;
    }
    if (device.removable) {
        spdlog::info("Skipping {}: removable", device.path);
        return false;
    }
    if (device.read_only) {
        spdlog::info("Skipping {}: read-only", device.path);
        return false;
    }
    if (device.capacity == 0) {
        spdlog::info("Skipping {}: zero capacity", device.path);
        return false;
    }
    return true;
}

auto select_target_device(const DeviceInventory& inventory, const std::optional<std::string>& boot_medium) noexcept -> std::optional<DeviceSelection> {
    std::vector<const BlockDevice*> candidates{};
    for (const auto& device : inventory) {
        if (is_eligible(device, boot_medium)) {
            candidates.push_back(&device);
        }
    }
    if (candidates.empty()) {
        spdlog::error("No eligible installation target among {} device(s)", inventory.size());
        return std::nullopt;
    }

    // best tier, then largest capacity, then smallest path
    const auto& ranks_before = [](const BlockDevice* lhs, const BlockDevice* rhs) {
        const auto lhs_tier = selection_tier(*lhs);
        const auto rhs_tier = selection_tier(*rhs);
        if (lhs_tier != rhs_tier) {
            return lhs_tier < rhs_tier;
        }
        if (lhs->capacity != rhs->capacity) {
            return lhs->capacity > rhs->capacity;
        }
        return lhs->path < rhs->path;
    };
    const auto* selected = *std::ranges::min_element(candidates, ranks_before);

    const auto reason = tier_reason(selection_tier(*selected));
    spdlog::info("Selected {} as installation target: {}", selected->path, reason);
    return std::make_optional<DeviceSelection>(DeviceSelection{.device = *selected, .reason = reason});
}

}  // namespace installer
