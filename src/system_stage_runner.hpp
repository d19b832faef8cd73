#ifndef SYSTEM_STAGE_RUNNER_HPP
#define SYSTEM_STAGE_RUNNER_HPP

#include "stage_runner.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace installer {

/// Packages every installation gets, the kernel is added from the profile.
[[nodiscard]] auto gen_base_packages(const InstallProfile& profile) noexcept -> std::vector<std::string>;

/// Checks whether any partition of device is mounted.
/// @param mtab_content Content of /etc/mtab.
[[nodiscard]] auto is_device_busy(std::string_view mtab_content, std::string_view device) noexcept -> bool;

/// Checks whether device or one of its partitions is an active swap area.
/// @param swaps_content Content of /proc/swaps.
[[nodiscard]] auto is_device_swapping(std::string_view swaps_content, std::string_view device) noexcept -> bool;

/// Checks whether other block devices (device-mapper, md) are stacked on device or its partitions.
/// @param sysfs_block_dir Usually /sys/block.
/// @return Name of the first holder found, std::nullopt if there is none.
[[nodiscard]] auto find_device_holder(std::string_view device, std::string_view sysfs_block_dir) noexcept -> std::optional<std::string>;

/// pacman/curl messages which mean a download failed because of the network.
[[nodiscard]] auto is_network_error_line(std::string_view line) noexcept -> bool;

/// Files and directories of the live system the runner inspects.
struct SystemPaths final {
    std::string pacman_conf{"/etc/pacman.conf"};
    std::string mirrorlist{"/etc/pacman.d/mirrorlist"};
    std::string mtab{"/etc/mtab"};
    std::string swaps{"/proc/swaps"};
    std::string sysfs_block{"/sys/block"};
};

/// Runs the stages on the live system with the real tools.
class SystemStageRunner final : public StageRunner {
 public:
    SystemStageRunner() noexcept = default;
    explicit SystemStageRunner(SystemPaths paths) noexcept : m_paths(std::move(paths)) { }

    auto partition(const PartitionPlan& plan) noexcept -> StageOutcome override;
    auto format(const PartitionPlan& plan) noexcept -> StageOutcome override;
    auto mount(const PartitionPlan& plan, std::string_view mountpoint, std::vector<std::string>& mounted) noexcept -> StageOutcome override;
    auto base_install(const InstallProfile& profile, std::string_view mountpoint, const ProgressCallback& progress) noexcept -> StageOutcome override;
    auto configure(const InstallProfile& profile, std::string_view mountpoint) noexcept -> StageOutcome override;
    auto install_bootloader(const PartitionPlan& plan, const InstallProfile& profile, std::string_view mountpoint) noexcept -> StageOutcome override;
    auto cleanup(const std::vector<std::string>& mountpoints) noexcept -> StageOutcome override;

 private:
    auto check_device_idle(std::string_view device) const noexcept -> StageOutcome;
    auto check_mirror() const noexcept -> StageOutcome;

    SystemPaths m_paths{};
};

}  // namespace installer

#endif  // SYSTEM_STAGE_RUNNER_HPP
