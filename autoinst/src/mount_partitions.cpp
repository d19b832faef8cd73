#include "autoinst/mount_partitions.hpp"
#include "autoinst/io_utils.hpp"

#include <filesystem>  // for create_directories

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace autoinst::mount {

auto gen_mount_command(std::string_view partition, std::string_view mount_dir, std::string_view mount_opts) noexcept -> std::string {
    if (!mount_opts.empty()) {
        return fmt::format(FMT_COMPILE("mount -o {} '{}' '{}' >>/tmp/autoinst-install.log 2>&1"), mount_opts, partition, mount_dir);
    }
    return fmt::format(FMT_COMPILE("mount '{}' '{}' >>/tmp/autoinst-install.log 2>&1"), partition, mount_dir);
}

auto mount_partition(std::string_view partition, std::string_view mount_dir, std::string_view mount_opts) noexcept -> bool {
    std::error_code err{};
    fs::create_directories(fs::path{mount_dir}, err);
    if (err) {
        spdlog::error("Failed to create mountpoint {}: {}", mount_dir, err.message());
        return false;
    }

    if (!utils::exec_checked(mount::gen_mount_command(partition, mount_dir, mount_opts))) {
        spdlog::error("Failed to mount {} at {}", partition, mount_dir);
        return false;
    }
    return true;
}

auto umount_mountpoint(std::string_view mount_dir) noexcept -> bool {
    const auto& umount_cmd = fmt::format(FMT_COMPILE("umount -v {} >>/tmp/autoinst-install.log 2>&1"), mount_dir);
    if (!utils::exec_checked(umount_cmd)) {
        spdlog::error("Failed to umount {}", mount_dir);
        return false;
    }
    return true;
}

}  // namespace autoinst::mount
