#include "autoinst/systemd_services.hpp"
#include "autoinst/io_utils.hpp"

#include <filesystem>  // for directory_iterator, exists

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace autoinst::services {

auto gen_unit_name(std::string_view service_name) noexcept -> std::string {
    if (service_name.find('.') != std::string_view::npos) {
        return std::string{service_name};
    }
    return fmt::format(FMT_COMPILE("{}.service"), service_name);
}

auto is_service_enabled(std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool {
    const auto& unit_dir = fs::path{root_mountpoint} / "etc/systemd/system";

    std::error_code err{};
    if (!fs::is_directory(unit_dir, err)) {
        return false;
    }

    // enabled units are linked into <target>.wants or <target>.requires
    const auto& unit_name = services::gen_unit_name(service_name);
    for (auto dir_it = fs::directory_iterator{unit_dir, err}; !err && dir_it != fs::directory_iterator{}; dir_it.increment(err)) {
        const auto& dep_dir = dir_it->path().filename().string();
        if (!dep_dir.ends_with(".wants"sv) && !dep_dir.ends_with(".requires"sv)) {
            continue;
        }
        // dangling links are fine, they point into /usr of the target
        std::error_code link_err{};
        if (fs::is_symlink(dir_it->path() / unit_name, link_err) || fs::exists(dir_it->path() / unit_name, link_err)) {
            return true;
        }
    }
    return false;
}

auto enable_systemd_service(std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool {
    if (services::is_service_enabled(service_name, root_mountpoint)) {
        spdlog::info("{} is already enabled", service_name);
        return true;
    }

    const auto& systemctl_cmd = fmt::format(FMT_COMPILE("systemctl enable {}"), service_name);
    if (!utils::arch_chroot_checked(systemctl_cmd, root_mountpoint)) {
        spdlog::error("Failed to enable systemd service on {}: {}", root_mountpoint, service_name);
        return false;
    }
    spdlog::info("Enabled {}", service_name);
    return true;
}

}  // namespace autoinst::services
