#include "autoinst/fstab.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/io_utils.hpp"

#include <filesystem>  // for exists

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace autoinst::fs {

auto run_genfstab_on_mount(std::string_view root_mountpoint) noexcept -> bool {
    const auto& fstab_filepath = fmt::format(FMT_COMPILE("{}/etc/fstab"), root_mountpoint);

    // run command to generate fstab
    const auto& fstab_cmd = fmt::format(FMT_COMPILE("genfstab -U -p {} > {}"), root_mountpoint, fstab_filepath);
    if (!utils::exec_checked(fstab_cmd)) {
        spdlog::error("Failed to run genfstab: {}", fstab_cmd);
        return false;
    }

    // dump generated fstab file into the log
    if (std::filesystem::exists(fstab_filepath)) {
        const auto& fstab_content = file_utils::read_whole_file(fstab_filepath);
        spdlog::info("Created fstab file:\n{}", fstab_content);
    }
    return true;
}

}  // namespace autoinst::fs
