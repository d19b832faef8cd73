#ifndef DISK_SELECTOR_HPP
#define DISK_SELECTOR_HPP

#include "block_device.hpp"

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace installer {

/// Ranking tier, lower is preferred.
enum class SelectionTier : std::uint8_t {
    Nvme,
    Ssd,
    Other
};

struct DeviceSelection final {
    BlockDevice device;
    // why the device won, printed to the operator
    std::string_view reason;
};

[[nodiscard]] auto selection_tier(const BlockDevice& device) noexcept -> SelectionTier;

/// Whether the device may be chosen at all.
/// The live boot medium, removable, read-only and empty devices are never targets.
[[nodiscard]] auto is_eligible(const BlockDevice& device, const std::optional<std::string>& boot_medium) noexcept -> bool;

/// Picks the install target.
///
/// Devices of the best non-empty tier compete on capacity, ties are broken
/// by the lexicographically smallest path, so the same inventory always
/// yields the same device.
/// @param inventory Devices found on the machine.
/// @param boot_medium Path of the disk the live image runs from, if known.
/// @return std::nullopt if no device is eligible.
[[nodiscard]] auto select_target_device(const DeviceInventory& inventory, const std::optional<std::string>& boot_medium) noexcept -> std::optional<DeviceSelection>;

}  // namespace installer

#endif  // DISK_SELECTOR_HPP
