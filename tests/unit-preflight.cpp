#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "preflight.hpp"

// import autoinst
#include "autoinst/logger.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto UEFI_MTAB = R"(proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0
sys /sys sysfs rw,nosuid,nodev,noexec,relatime 0 0
efivarfs /sys/firmware/efi/efivars efivarfs rw,nosuid,nodev,noexec,relatime 0 0
airootfs / overlay rw,relatime,lowerdir=/run/archiso/airootfs 0 0
)"sv;

static constexpr auto BIOS_MTAB = R"(proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0
sys /sys sysfs rw,nosuid,nodev,noexec,relatime 0 0
airootfs / overlay rw,relatime,lowerdir=/run/archiso/airootfs 0 0
)"sv;

TEST_CASE("preflight test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    spdlog::set_default_logger(logger);
    autoinst::logger::set_logger(logger);

    static constexpr auto firmware_dir = "/tmp/autoinst-preflight-efi"sv;
    fs::create_directories(firmware_dir);

    SECTION("efivarfs mount")
    {
        REQUIRE(installer::has_efivarfs_mount(UEFI_MTAB));
        REQUIRE(!installer::has_efivarfs_mount(BIOS_MTAB));
        REQUIRE(!installer::has_efivarfs_mount(""sv));
    }
    SECTION("uefi environment")
    {
        REQUIRE(installer::is_uefi_environment(firmware_dir, UEFI_MTAB));
    }
    SECTION("legacy bios")
    {
        REQUIRE(!installer::is_uefi_environment(firmware_dir, BIOS_MTAB));
        REQUIRE(!installer::is_uefi_environment("/tmp/autoinst-preflight-no-efi"sv, UEFI_MTAB));
    }

    fs::remove_all(firmware_dir);
}
