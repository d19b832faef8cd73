#include "doctest_compatibility.h"

#include "autoinst/logger.hpp"
#include "autoinst/system_query.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

TEST_CASE("disk transport conversion test")
{
    using autoinst::disk::DiskTransport;
    using autoinst::disk::disk_transport_to_string;
    using autoinst::disk::string_to_disk_transport;

    SECTION("transport to string")
    {
        CHECK(disk_transport_to_string(DiskTransport::Sata) == "sata"sv);
        CHECK(disk_transport_to_string(DiskTransport::Nvme) == "nvme"sv);
        CHECK(disk_transport_to_string(DiskTransport::Usb) == "usb"sv);
        CHECK(disk_transport_to_string(DiskTransport::Unknown) == "unknown"sv);
    }
    SECTION("string to transport")
    {
        CHECK(string_to_disk_transport("ata"sv) == DiskTransport::Sata);
        CHECK(string_to_disk_transport("nvme"sv) == DiskTransport::Nvme);
        CHECK(string_to_disk_transport("sas"sv) == DiskTransport::Scsi);
        CHECK(string_to_disk_transport(""sv) == DiskTransport::Unknown);
    }
}

TEST_CASE("format size test")
{
    using autoinst::disk::format_size;

    SECTION("small sizes")
    {
        CHECK(format_size(0) == "0B"sv);
        CHECK(format_size(1023) == "1023B"sv);
        CHECK(format_size(2048) == "2KiB"sv);
        CHECK(format_size(1024ULL * 1024) == "1MiB"sv);
    }
    SECTION("disk sizes")
    {
        CHECK(format_size(1024ULL * 1024 * 1024) == "1.0GiB"sv);
        CHECK(format_size(500ULL * 1024 * 1024 * 1024) == "500.0GiB"sv);
        CHECK(format_size(2ULL * 1024 * 1024 * 1024 * 1024) == "2.0TiB"sv);
    }
}

TEST_CASE("partition device naming test")
{
    using autoinst::disk::get_disk_name_from_device;
    using autoinst::disk::make_partition_device;

    SECTION("sata disks")
    {
        CHECK(make_partition_device("/dev/sda"sv, 1) == "/dev/sda1"sv);
        CHECK(make_partition_device("/dev/vdb"sv, 2) == "/dev/vdb2"sv);
    }
    SECTION("disks ending with a digit")
    {
        CHECK(make_partition_device("/dev/nvme0n1"sv, 1) == "/dev/nvme0n1p1"sv);
        CHECK(make_partition_device("/dev/mmcblk0"sv, 2) == "/dev/mmcblk0p2"sv);
    }
    SECTION("disk name from partition")
    {
        CHECK(get_disk_name_from_device("/dev/sda1"sv) == "sda"sv);
        CHECK(get_disk_name_from_device("/dev/nvme0n1p2"sv) == "nvme0n1"sv);
        CHECK(get_disk_name_from_device("nvme0n1"sv) == "nvme0n1"sv);
        CHECK(get_disk_name_from_device("/dev/sr0"sv) == "sr"sv);
    }
}

TEST_CASE("parse_lsblk_disks_json test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    autoinst::logger::set_logger(logger);

    using autoinst::disk::DiskTransport;
    using autoinst::disk::parse_lsblk_disks_json;

    SECTION("empty json output")
    {
        auto disks = parse_lsblk_disks_json(""sv);
        CHECK(disks.empty());
    }
    SECTION("malformed json output")
    {
        auto disks = parse_lsblk_disks_json(R"({"blockdevices": [)"sv);
        CHECK(disks.empty());
    }
    SECTION("mixed machine")
    {
        constexpr auto json = R"({
            "blockdevices": [
                {
                    "name": "/dev/sda", "type": "disk", "size": 2000398934016,
                    "model": "ST2000DM008", "fstype": null, "uuid": null, "partuuid": null,
                    "mountpoint": null, "rm": false, "ro": false, "rota": true, "tran": "sata"
                },
                {
                    "name": "/dev/sdb", "type": "disk", "size": 500107862016,
                    "model": "Samsung SSD 860", "fstype": null, "uuid": null, "partuuid": null,
                    "mountpoint": null, "rm": false, "ro": false, "rota": false, "tran": "sata"
                },
                {
                    "name": "/dev/sdc", "type": "disk", "size": 31025463296,
                    "model": "Ultra USB 3.0", "fstype": "iso9660", "uuid": "2024-05-01-10-00-00-00", "partuuid": null,
                    "mountpoint": null, "rm": true, "ro": false, "rota": true, "tran": "usb",
                    "children": [
                        {
                            "name": "/dev/sdc1", "type": "part", "size": 1073741824,
                            "model": null, "fstype": "iso9660", "uuid": "2024-05-01-10-00-00-00", "partuuid": "6e4c2a2b-01",
                            "mountpoint": "/run/archiso/bootmnt", "rm": true, "ro": false, "rota": true, "tran": null
                        }
                    ]
                },
                {
                    "name": "/dev/loop0", "type": "loop", "size": 838860800,
                    "model": null, "fstype": "squashfs", "uuid": null, "partuuid": null,
                    "mountpoint": "/run/archiso/airootfs", "rm": false, "ro": true, "rota": false, "tran": null
                },
                {
                    "name": "/dev/nvme0n1", "type": "disk", "size": 1000204886016,
                    "model": "Samsung SSD 980 PRO", "fstype": null, "uuid": null, "partuuid": null,
                    "mountpoint": null, "rm": false, "ro": false, "rota": false, "tran": "nvme"
                }
            ]
        })"sv;

        auto disks = parse_lsblk_disks_json(json);
        REQUIRE(disks.size() == 4);

        CHECK(disks[0].device == "/dev/sda"sv);
        CHECK(disks[0].transport == DiskTransport::Sata);
        CHECK(disks[0].is_rotational);
        CHECK(disks[0].size == 2000398934016ULL);

        CHECK(disks[1].device == "/dev/sdb"sv);
        CHECK(!disks[1].is_rotational);
        CHECK(disks[1].model.value() == "Samsung SSD 860"sv);

        CHECK(disks[2].device == "/dev/sdc"sv);
        CHECK(disks[2].is_removable);
        CHECK(disks[2].transport == DiskTransport::Usb);
        REQUIRE(disks[2].partitions.size() == 1);
        CHECK(disks[2].partitions[0].is_mounted);
        CHECK(disks[2].partitions[0].mountpoint.value() == "/run/archiso/bootmnt"sv);

        CHECK(disks[3].device == "/dev/nvme0n1"sv);
        CHECK(disks[3].transport == DiskTransport::Nvme);
        CHECK(!disks[3].is_rotational);
        CHECK(disks[3].partitions.empty());
    }
    SECTION("older lsblk string flags")
    {
        constexpr auto json = R"({
            "blockdevices": [
                {"name": "/dev/vda", "type": "disk", "size": "21474836480", "model": null,
                 "mountpoint": null, "rm": "0", "ro": "0", "rota": "1", "tran": null}
            ]
        })"sv;

        auto disks = parse_lsblk_disks_json(json);
        REQUIRE(disks.size() == 1);
        CHECK(disks[0].size == 21474836480ULL);
        CHECK(!disks[0].is_removable);
        CHECK(disks[0].is_rotational);
        CHECK(!disks[0].model.has_value());
        CHECK(disks[0].transport == DiskTransport::Virtio);
    }
    SECTION("unparsable size strings")
    {
        constexpr auto json = R"({
            "blockdevices": [
                {"name": "/dev/vda", "type": "disk", "size": "99999999999999999999999", "rota": "1"},
                {"name": "/dev/vdb", "type": "disk", "size": "12G", "rota": "1"},
                {"name": "/dev/vdc", "type": "disk", "size": "18446744073709551615", "rota": "1"}
            ]
        })"sv;

        auto disks = parse_lsblk_disks_json(json);
        REQUIRE(disks.size() == 3);
        // out of range and garbage sizes must not wrap around
        CHECK(disks[0].size == 0U);
        CHECK(disks[1].size == 0U);
        CHECK(disks[2].size == 18446744073709551615ULL);
    }
    SECTION("missing rotational flag")
    {
        constexpr auto json = R"({"blockdevices": [{"name": "/dev/sda", "type": "disk", "size": 1024}]})"sv;

        auto disks = parse_lsblk_disks_json(json);
        REQUIRE(disks.size() == 1);
        CHECK(disks[0].is_rotational);
        CHECK(disks[0].transport == DiskTransport::Unknown);
    }
}
