#include "autoinst/fs_utils.hpp"
#include "autoinst/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace autoinst::fs::utils {

auto format_partition(const Partition& partition) noexcept -> bool {
    const auto& mkfs_cmd = fs::get_mkfs_command(partition.fstype);
    if (mkfs_cmd.empty()) {
        spdlog::error("Don't know how to create filesystem '{}' on {}", fs::filesystem_type_to_string(partition.fstype), partition.device);
        return false;
    }

    const auto& format_cmd = fmt::format(FMT_COMPILE("{} '{}' >>/tmp/autoinst-install.log 2>&1"), mkfs_cmd, partition.device);
    if (!autoinst::utils::exec_checked(format_cmd)) {
        spdlog::error("Failed to create filesystem on {}: {}", partition.device, format_cmd);
        return false;
    }
    spdlog::info("Created {} on {}", fs::filesystem_type_to_string(partition.fstype), partition.device);
    return true;
}

auto get_device_partuuid(std::string_view device) noexcept -> std::string {
    return autoinst::utils::exec(fmt::format(FMT_COMPILE("lsblk -dno PARTUUID '{}'"), device));
}

}  // namespace autoinst::fs::utils
