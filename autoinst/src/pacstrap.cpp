#include "autoinst/pacstrap.hpp"
#include "autoinst/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace autoinst::pacstrap {

auto gen_pacstrap_command(const std::vector<std::string>& packages, std::string_view root_mountpoint) noexcept -> std::string {
    // -K: initialize an empty keyring in the target
    return fmt::format(FMT_COMPILE("pacstrap -K {} {}"), root_mountpoint, utils::join(packages, ' '));
}

auto install_packages(const std::vector<std::string>& packages, std::string_view root_mountpoint, const utils::LineCallback& line_callback) noexcept -> bool {
    if (packages.empty()) {
        spdlog::error("Nothing to install into {}", root_mountpoint);
        return false;
    }

    const auto& pacstrap_cmd = pacstrap::gen_pacstrap_command(packages, root_mountpoint);
    spdlog::info("Running '{}'", pacstrap_cmd);

    const auto& follow_line = [&line_callback](std::string_view line) {
        spdlog::debug("[pacstrap] {}", line);
        if (line_callback) {
            line_callback(line);
        }
    };
    if (!utils::exec_follow(pacstrap_cmd, follow_line)) {
        spdlog::error("Failed to install packages into {}", root_mountpoint);
        return false;
    }
    return true;
}

}  // namespace autoinst::pacstrap
