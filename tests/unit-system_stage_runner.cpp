#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "install_profile.hpp"
#include "partition_planner.hpp"
#include "system_stage_runner.hpp"

// import autoinst
#include "autoinst/file_utils.hpp"
#include "autoinst/logger.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

static constexpr auto MTAB_TEST = R"(proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0
/dev/sdb1 /run/archiso/bootmnt iso9660 ro,relatime 0 0
airootfs / overlay rw,relatime 0 0
/dev/nvme1n1p2 /mnt/data ext4 rw,relatime 0 0
)"sv;

TEST_CASE("device busy test")
{
    SECTION("partition of device is mounted")
    {
        REQUIRE(installer::is_device_busy(MTAB_TEST, "/dev/sdb"sv));
        REQUIRE(installer::is_device_busy(MTAB_TEST, "/dev/nvme1n1"sv));
    }
    SECTION("idle device")
    {
        REQUIRE(!installer::is_device_busy(MTAB_TEST, "/dev/sda"sv));
        REQUIRE(!installer::is_device_busy(MTAB_TEST, "/dev/nvme0n1"sv));
    }
    SECTION("similar names")
    {
        static constexpr auto mtab = "/dev/sdaa1 /mnt ext4 rw 0 0\n/dev/nvme0n10p1 /srv ext4 rw 0 0\n/dev/nvme0n10 /opt ext4 rw 0 0\n"sv;
        REQUIRE(!installer::is_device_busy(mtab, "/dev/sda"sv));
        REQUIRE(!installer::is_device_busy(mtab, "/dev/nvme0n1"sv));
    }
    SECTION("device-mapper volume on the disk is not visible in mtab")
    {
        static constexpr auto mtab = "/dev/mapper/vg-root / ext4 rw 0 0\n"sv;
        REQUIRE(!installer::is_device_busy(mtab, "/dev/sda"sv));
    }
    SECTION("whole disk mounted")
    {
        REQUIRE(installer::is_device_busy("/dev/vdb /mnt ext4 rw 0 0\n"sv, "/dev/vdb"sv));
    }
}

TEST_CASE("base packages test")
{
    SECTION("defaults")
    {
        const installer::InstallProfile profile{.hostname = "testhost"};
        REQUIRE_EQ(installer::gen_base_packages(profile), std::vector<std::string>{"base", "linux-firmware", "linux", "efibootmgr", "sudo"});
    }
    SECTION("kernel and extra packages")
    {
        const installer::InstallProfile profile{.hostname = "testhost", .kernel = "linux-lts", .packages = {"vim", "git"}};
        REQUIRE_EQ(installer::gen_base_packages(profile), std::vector<std::string>{"base", "linux-firmware", "linux-lts", "efibootmgr", "sudo", "vim", "git"});
    }
}

static constexpr auto SWAPS_TEST = R"(Filename				Type		Size		Used		Priority
/dev/sda2                               partition	8388604		0		-2
/swapfile                               file		2097148		0		-3
/dev/nvme0n1p3                          partition	4194300		0		-4
)"sv;

TEST_CASE("swap usage test")
{
    SECTION("swap partitions")
    {
        REQUIRE(installer::is_device_swapping(SWAPS_TEST, "/dev/sda"sv));
        REQUIRE(installer::is_device_swapping(SWAPS_TEST, "/dev/nvme0n1"sv));
    }
    SECTION("swap files and other disks")
    {
        REQUIRE(!installer::is_device_swapping(SWAPS_TEST, "/dev/sdb"sv));
        REQUIRE(!installer::is_device_swapping(SWAPS_TEST, "/dev/nvme1n1"sv));
    }
    SECTION("no swap")
    {
        REQUIRE(!installer::is_device_swapping("Filename\tType\tSize\tUsed\tPriority\n"sv, "/dev/sda"sv));
        REQUIRE(!installer::is_device_swapping(""sv, "/dev/sda"sv));
    }
}

TEST_CASE("device holders test")
{
    static constexpr std::string_view sysfs_testpath{"/tmp/test-autoinst-sysfs-block"};
    fs::remove_all(sysfs_testpath);

    // sda2 is an LVM physical volume, sdb is unused, nvme0n1 is a LUKS container as a whole
    fs::create_directories("/tmp/test-autoinst-sysfs-block/sda/holders");
    fs::create_directories("/tmp/test-autoinst-sysfs-block/sda/sda1/holders");
    fs::create_directories("/tmp/test-autoinst-sysfs-block/sda/sda2/holders/dm-0");
    fs::create_directories("/tmp/test-autoinst-sysfs-block/sda/queue");
    fs::create_directories("/tmp/test-autoinst-sysfs-block/sdb/holders");
    fs::create_directories("/tmp/test-autoinst-sysfs-block/sdb/sdb1/holders");
    fs::create_directories("/tmp/test-autoinst-sysfs-block/nvme0n1/holders/dm-1");

    SECTION("holder on a partition")
    {
        const auto& holder = installer::find_device_holder("/dev/sda"sv, sysfs_testpath);
        REQUIRE(holder.has_value());
        REQUIRE_EQ(*holder, "dm-0");
    }
    SECTION("holder on the whole disk")
    {
        REQUIRE_EQ(installer::find_device_holder("/dev/nvme0n1"sv, sysfs_testpath), std::optional<std::string>{"dm-1"});
    }
    SECTION("no holders")
    {
        REQUIRE(!installer::find_device_holder("/dev/sdb"sv, sysfs_testpath).has_value());
        REQUIRE(!installer::find_device_holder("/dev/vda"sv, sysfs_testpath).has_value());
    }

    // Cleanup.
    fs::remove_all(sysfs_testpath);
}

TEST_CASE("network error lines test")
{
    REQUIRE(installer::is_network_error_line("error: failed retrieving file 'core.db' from geo.mirror.pkgbuild.com : Could not resolve host: geo.mirror.pkgbuild.com"sv));
    REQUIRE(installer::is_network_error_line("error: failed to synchronize all databases (download library error)"sv));
    REQUIRE(installer::is_network_error_line("error: failed retrieving file 'linux-6.9.1.arch1-1-x86_64.pkg.tar.zst' from mirror : Connection timed out after 10001 milliseconds"sv));
    REQUIRE(!installer::is_network_error_line("error: target not found: linux-foo"sv));
    REQUIRE(!installer::is_network_error_line("(1/1) installing base"sv));
    REQUIRE(!installer::is_network_error_line(""sv));
}

TEST_CASE("system stage runner checks test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    spdlog::set_default_logger(logger);
    autoinst::logger::set_logger(logger);

    static constexpr std::string_view folder_testpath{"/tmp/test-autoinst-stage-runner"};
    fs::remove_all(folder_testpath);
    fs::create_directories("/tmp/test-autoinst-stage-runner/sys/block/sda/sda1/holders");

    REQUIRE(autoinst::file_utils::create_file_for_overwrite("/tmp/test-autoinst-stage-runner/mtab"sv, "airootfs / overlay rw 0 0\n"sv));
    REQUIRE(autoinst::file_utils::create_file_for_overwrite("/tmp/test-autoinst-stage-runner/swaps"sv, SWAPS_TEST));
    REQUIRE(autoinst::file_utils::create_file_for_overwrite("/tmp/test-autoinst-stage-runner/pacman.conf"sv, "[options]\n"sv));

    const installer::SystemPaths paths{
        .pacman_conf = "/tmp/test-autoinst-stage-runner/pacman.conf",
        .mirrorlist  = "/tmp/test-autoinst-stage-runner/mirrorlist",
        .mtab        = "/tmp/test-autoinst-stage-runner/mtab",
        .swaps       = "/tmp/test-autoinst-stage-runner/swaps",
        .sysfs_block = "/tmp/test-autoinst-stage-runner/sys/block",
    };
    installer::SystemStageRunner runner{paths};
    const installer::InstallProfile profile{.hostname = "testhost"};

    SECTION("swap on the target stops partitioning")
    {
        const auto& plan = installer::plan_partitions("/dev/sda"sv, 64ULL * 1024 * installer::MiB);
        REQUIRE(plan.has_value());

        const auto& outcome = runner.partition(*plan);
        REQUIRE(!outcome.success);
        REQUIRE(outcome.cause == installer::FailureCause::DeviceBusy);
    }
    SECTION("device-mapper holder stops partitioning")
    {
        fs::create_directories("/tmp/test-autoinst-stage-runner/sys/block/sdc/sdc3/holders/dm-2");
        const auto& plan = installer::plan_partitions("/dev/sdc"sv, 64ULL * 1024 * installer::MiB);
        REQUIRE(plan.has_value());

        const auto& outcome = runner.partition(*plan);
        REQUIRE(!outcome.success);
        REQUIRE(outcome.cause == installer::FailureCause::DeviceBusy);
        REQUIRE(outcome.detail.find("dm-2") != std::string::npos);
    }
    SECTION("missing mtab")
    {
        installer::SystemStageRunner broken_runner{installer::SystemPaths{.mtab = "/tmp/test-autoinst-stage-runner/nonexistent"}};
        const auto& plan = installer::plan_partitions("/dev/sdc"sv, 64ULL * 1024 * installer::MiB);
        REQUIRE(plan.has_value());

        const auto& outcome = broken_runner.partition(*plan);
        REQUIRE(!outcome.success);
        REQUIRE(outcome.cause == installer::FailureCause::MissingFile);
    }
    SECTION("unreachable mirror is a network failure")
    {
        // nothing listens on the discard port
        REQUIRE(autoinst::file_utils::create_file_for_overwrite(paths.mirrorlist, "#Server = https://geo.mirror.pkgbuild.com/$repo/os/$arch\nServer = http://127.0.0.1:9/$repo/os/$arch\n"sv));

        const auto& outcome = runner.base_install(profile, "/tmp/test-autoinst-stage-runner/target"sv, {});
        REQUIRE(!outcome.success);
        REQUIRE(outcome.cause == installer::FailureCause::NetworkUnavailable);
        REQUIRE(!fs::exists("/tmp/test-autoinst-stage-runner/target"));
    }
    SECTION("mirrorlist without servers")
    {
        REQUIRE(autoinst::file_utils::create_file_for_overwrite(paths.mirrorlist, "#Server = https://geo.mirror.pkgbuild.com/$repo/os/$arch\n"sv));

        const auto& outcome = runner.base_install(profile, "/tmp/test-autoinst-stage-runner/target"sv, {});
        REQUIRE(!outcome.success);
        REQUIRE(outcome.cause == installer::FailureCause::MissingFile);
    }
    SECTION("missing mirrorlist")
    {
        const auto& outcome = runner.base_install(profile, "/tmp/test-autoinst-stage-runner/target"sv, {});
        REQUIRE(!outcome.success);
        REQUIRE(outcome.cause == installer::FailureCause::MissingFile);
    }

    // Cleanup.
    fs::remove_all(folder_testpath);
}
