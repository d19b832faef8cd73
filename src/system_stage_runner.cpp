#include "system_stage_runner.hpp"
#include "config_applier.hpp"

// import autoinst
#include "autoinst/bootloader.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/fs_utils.hpp"
#include "autoinst/fstab.hpp"
#include "autoinst/mount_partitions.hpp"
#include "autoinst/mtab.hpp"
#include "autoinst/pacstrap.hpp"
#include "autoinst/partitioning.hpp"
#include "autoinst/repos.hpp"
#include "autoinst/string_utils.hpp"

#include <algorithm>     // for sort, any_of, all_of
#include <array>         // for array
#include <filesystem>    // for exists, directory_iterator
#include <system_error>  // for error_code

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace {

// e.g /dev/sda1 of /dev/sda, /dev/nvme0n1p1 of /dev/nvme0n1, but not /dev/sdaa or /dev/nvme0n10
auto is_device_or_partition(std::string_view source, std::string_view device) noexcept -> bool {
    if (device.empty() || !source.starts_with(device)) {
        return false;
    }
    auto part_suffix = source.substr(device.size());
    if (part_suffix.empty()) {
        return true;
    }

    const auto& is_digit = [](char ch) { return ch >= '0' && ch <= '9'; };
    // disks ending with a digit separate the partition number with 'p'
    if (is_digit(device.back())) {
        if (!part_suffix.starts_with('p')) {
            return false;
        }
        part_suffix.remove_prefix(1);
    }
    return !part_suffix.empty() && std::ranges::all_of(part_suffix, is_digit);
}

}  // namespace

namespace installer {

auto gen_base_packages(const InstallProfile& profile) noexcept -> std::vector<std::string> {
    std::vector<std::string> packages{"base", "linux-firmware", profile.kernel, "efibootmgr", "sudo"};
    packages.insert(packages.end(), profile.packages.begin(), profile.packages.end());
    return packages;
}

auto is_device_busy(std::string_view mtab_content, std::string_view device) noexcept -> bool {
    const auto& mtab_entries = autoinst::mtab::parse_mtab_content(mtab_content, "/"sv);
    return std::ranges::any_of(mtab_entries, [device](auto&& entry) { return is_device_or_partition(entry.device, device); });
}

auto is_device_swapping(std::string_view swaps_content, std::string_view device) noexcept -> bool {
    // Filename Type Size Used Priority
    for (auto&& line : autoinst::utils::make_split_view(swaps_content)) {
        const auto& swap_entry = autoinst::utils::trim(line);
        const auto& swap_source = swap_entry.substr(0, swap_entry.find_first_of(" \t"sv));
        if (is_device_or_partition(swap_source, device)) {
            return true;
        }
    }
    return false;
}

auto find_device_holder(std::string_view device, std::string_view sysfs_block_dir) noexcept -> std::optional<std::string> {
    const auto& disk_name = fs::path{device}.filename().string();
    const auto& disk_dir  = fs::path{sysfs_block_dir} / disk_name;

    const auto& first_holder = [](const fs::path& holders_dir) -> std::optional<std::string> {
        std::error_code err{};
        auto holder_it = fs::directory_iterator{holders_dir, err};
        if (err || holder_it == fs::directory_iterator{}) {
            return std::nullopt;
        }
        return std::make_optional<std::string>(holder_it->path().filename().string());
    };

    if (auto holder = first_holder(disk_dir / "holders")) {
        return holder;
    }

    // partitions are subdirectories named after the disk, e.g sda/sda2, nvme0n1/nvme0n1p1
    std::error_code err{};
    for (auto dir_it = fs::directory_iterator{disk_dir, err}; !err && dir_it != fs::directory_iterator{}; dir_it.increment(err)) {
        const auto& entry_name = dir_it->path().filename().string();
        if (!entry_name.starts_with(disk_name) || entry_name == disk_name) {
            continue;
        }
        if (auto holder = first_holder(dir_it->path() / "holders")) {
            return holder;
        }
    }
    return std::nullopt;
}

auto is_network_error_line(std::string_view line) noexcept -> bool {
    static constexpr std::array network_errors{
        "failed retrieving file"sv,
        "Could not resolve host"sv,
        "failed to synchronize all databases"sv,
        "Connection timed out"sv,
        "Operation too slow"sv,
    };
    return std::ranges::any_of(network_errors, [line](auto&& msg) { return line.find(msg) != std::string_view::npos; });
}

auto SystemStageRunner::check_device_idle(std::string_view device) const noexcept -> StageOutcome {
    const auto& mtab_content = autoinst::mtab::read_mtab(m_paths.mtab);
    if (!mtab_content) {
        return StageOutcome::failure(FailureCause::MissingFile, fmt::format(FMT_COMPILE("failed to read {}"), m_paths.mtab));
    }
    if (is_device_busy(*mtab_content, device)) {
        return StageOutcome::failure(FailureCause::DeviceBusy, fmt::format(FMT_COMPILE("{} is mounted"), device));
    }

    // kernels without swap support have no swaps file
    const auto& swaps_content = autoinst::file_utils::read_virtual_file(m_paths.swaps);
    if (!swaps_content) {
        spdlog::debug("{} is not readable, skipping swap check", m_paths.swaps);
    } else if (is_device_swapping(*swaps_content, device)) {
        return StageOutcome::failure(FailureCause::DeviceBusy, fmt::format(FMT_COMPILE("{} is used as swap"), device));
    }

    if (const auto& holder = find_device_holder(device, m_paths.sysfs_block)) {
        return StageOutcome::failure(FailureCause::DeviceBusy, fmt::format(FMT_COMPILE("{} is held by {}"), device, *holder));
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::partition(const PartitionPlan& plan) noexcept -> StageOutcome {
    // nothing may touch the disk before this
    if (auto idle_check = check_device_idle(plan.device); !idle_check.success) {
        return idle_check;
    }

    if (!autoinst::disk::make_clean_partschema(plan.device, to_partition_schema(plan))) {
        return StageOutcome::failure(FailureCause::CommandFailed, fmt::format(FMT_COMPILE("failed to partition {}"), plan.device));
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::format(const PartitionPlan& plan) noexcept -> StageOutcome {
    for (const auto& part : to_partition_schema(plan)) {
        if (!autoinst::fs::utils::format_partition(part)) {
            return StageOutcome::failure(FailureCause::CommandFailed, fmt::format(FMT_COMPILE("failed to format {}"), part.device));
        }
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::mount(const PartitionPlan& plan, std::string_view mountpoint, std::vector<std::string>& mounted) noexcept -> StageOutcome {
    // parents before children, so root comes before /boot
    auto partitions = plan.partitions;
    std::ranges::sort(partitions, {}, [](auto&& part) { return part.mountpoint.size(); });

    for (const auto& part : partitions) {
        const auto& mount_dir = part.mountpoint == "/"sv ? std::string{mountpoint} : fmt::format(FMT_COMPILE("{}{}"), mountpoint, part.mountpoint);
        if (!autoinst::mount::mount_partition(part.device, mount_dir)) {
            return StageOutcome::failure(FailureCause::CommandFailed, fmt::format(FMT_COMPILE("failed to mount {} at {}"), part.device, mount_dir));
        }
        mounted.push_back(mount_dir);
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::check_mirror() const noexcept -> StageOutcome {
    if (!fs::exists(m_paths.mirrorlist)) {
        return StageOutcome::failure(FailureCause::MissingFile, fmt::format(FMT_COMPILE("{} doesn't exist"), m_paths.mirrorlist));
    }
    const auto& mirror = autoinst::repos::find_first_server(autoinst::file_utils::read_whole_file(m_paths.mirrorlist));
    if (!mirror) {
        return StageOutcome::failure(FailureCause::MissingFile, fmt::format(FMT_COMPILE("no active mirror in {}"), m_paths.mirrorlist));
    }

    // every base package comes from core
    const autoinst::repos::CustomRepo core_repo{.name = "core", .server = *mirror};
    if (!autoinst::repos::is_repo_reachable(core_repo)) {
        return StageOutcome::failure(FailureCause::NetworkUnavailable, fmt::format(FMT_COMPILE("mirror {} is unreachable"), *mirror));
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::base_install(const InstallProfile& profile, std::string_view mountpoint, const ProgressCallback& progress) noexcept -> StageOutcome {
    if (auto mirror_check = check_mirror(); !mirror_check.success) {
        return mirror_check;
    }
    for (const auto& repo : profile.repositories) {
        if (!autoinst::repos::is_repo_reachable(repo)) {
            return StageOutcome::failure(FailureCause::NetworkUnavailable, fmt::format(FMT_COMPILE("repository '{}' is unreachable"), repo.name));
        }
    }

    // pacstrap resolves packages with the live pacman.conf
    if (!fs::exists(m_paths.pacman_conf)) {
        return StageOutcome::failure(FailureCause::MissingFile, fmt::format(FMT_COMPILE("{} doesn't exist"), m_paths.pacman_conf));
    }
    for (const auto& repo : profile.repositories) {
        if (!autoinst::repos::add_custom_repo(repo, m_paths.pacman_conf)) {
            return StageOutcome::failure(FailureCause::CommandFailed, fmt::format(FMT_COMPILE("failed to add repository '{}'"), repo.name));
        }
    }
    if (profile.multilib && !autoinst::repos::enable_multilib(m_paths.pacman_conf)) {
        return StageOutcome::failure(FailureCause::CommandFailed, "failed to enable multilib");
    }

    bool network_failed{};
    const auto& follow_line = [&network_failed, &progress](std::string_view line) {
        network_failed = network_failed || is_network_error_line(line);
        if (progress) {
            progress(line);
        }
    };
    if (!autoinst::pacstrap::install_packages(gen_base_packages(profile), mountpoint, follow_line)) {
        if (network_failed) {
            return StageOutcome::failure(FailureCause::NetworkUnavailable, "pacstrap failed to download packages");
        }
        return StageOutcome::failure(FailureCause::CommandFailed, "pacstrap failed");
    }
    if (!autoinst::fs::run_genfstab_on_mount(mountpoint)) {
        return StageOutcome::failure(FailureCause::CommandFailed, "genfstab failed");
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::configure(const InstallProfile& profile, std::string_view mountpoint) noexcept -> StageOutcome {
    const auto& report = apply_config(profile, mountpoint);
    if (!report.succeeded()) {
        return StageOutcome::failure(FailureCause::CommandFailed, report.summary());
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::install_bootloader(const PartitionPlan& plan, const InstallProfile& profile, std::string_view mountpoint) noexcept -> StageOutcome {
    const auto& root_part = find_partition(plan, PartitionRole::Root);
    const auto& esp_part  = find_partition(plan, PartitionRole::Esp);
    if (!root_part || !esp_part) {
        return StageOutcome::failure(FailureCause::InvalidState, "plan has no root or ESP partition");
    }

    const auto& root_partuuid = autoinst::fs::utils::get_device_partuuid(root_part->device);
    if (root_partuuid.empty()) {
        return StageOutcome::failure(FailureCause::MissingFile, fmt::format(FMT_COMPILE("no PARTUUID for {}"), root_part->device));
    }

    const autoinst::bootloader::SystemdBootInstallConfig install_config{
        .root_mountpoint = mountpoint,
        .boot_mountpoint = esp_part->mountpoint,
        .kernel          = profile.kernel,
        .root_partuuid   = root_partuuid,
        .timeout         = profile.boot_timeout,
    };
    if (!autoinst::bootloader::install_systemd_boot(install_config)) {
        return StageOutcome::failure(FailureCause::CommandFailed, "failed to install systemd-boot");
    }
    return StageOutcome::ok();
}

auto SystemStageRunner::cleanup(const std::vector<std::string>& mountpoints) noexcept -> StageOutcome {
    std::vector<std::string> failed{};
    for (const auto& mount_dir : mountpoints) {
        if (!autoinst::mount::umount_mountpoint(mount_dir)) {
            failed.push_back(mount_dir);
        }
    }
    if (!failed.empty()) {
        return StageOutcome::failure(FailureCause::CommandFailed, fmt::format("failed to unmount {}", fmt::join(failed, ", ")));
    }
    return StageOutcome::ok();
}

}  // namespace installer
