#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "block_device.hpp"

// import autoinst
#include "autoinst/logger.hpp"
#include "autoinst/system_query.hpp"

#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto LSBLK_TEST = R"({
   "blockdevices": [
      {"name":"/dev/sda", "type":"disk", "size":4000787030016, "model":"WDC WD40EFRX", "fstype":null, "uuid":null, "partuuid":null, "mountpoint":null, "rm":false, "ro":false, "rota":true, "tran":"sata"},
      {"name":"/dev/sdb", "type":"disk", "size":31914983424, "model":"Ultra USB 3.0", "fstype":"iso9660", "uuid":"2025-10-01-10-00-00-00", "partuuid":null, "mountpoint":null, "rm":true, "ro":false, "rota":true, "tran":"usb",
         "children": [
            {"name":"/dev/sdb1", "type":"part", "size":1184890880, "model":null, "fstype":"iso9660", "uuid":"2025-10-01-10-00-00-00", "partuuid":"a1b2c3d4-01", "mountpoint":"/run/archiso/bootmnt", "rm":true, "ro":false, "rota":true, "tran":null}
         ]
      },
      {"name":"/dev/sdc", "type":"disk", "size":1000204886016, "model":"Samsung SSD 870", "fstype":null, "uuid":null, "partuuid":null, "mountpoint":null, "rm":false, "ro":false, "rota":false, "tran":"sata"},
      {"name":"/dev/nvme0n1", "type":"disk", "size":512110190592, "model":"Samsung SSD 980", "fstype":null, "uuid":null, "partuuid":null, "mountpoint":null, "rm":false, "ro":false, "rota":false, "tran":"nvme"}
   ]
})"sv;

static constexpr auto MTAB_TEST = R"(proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0
sys /sys sysfs rw,nosuid,nodev,noexec,relatime 0 0
dev /dev devtmpfs rw,nosuid,relatime,size=8131876k,nr_inodes=2032969,mode=755,inode64 0 0
run /run tmpfs rw,nosuid,nodev,relatime,mode=755,inode64 0 0
efivarfs /sys/firmware/efi/efivars efivarfs rw,nosuid,nodev,noexec,relatime 0 0
/dev/sdb1 /run/archiso/bootmnt iso9660 ro,relatime,nojoliet,check=s,map=n,blocksize=2048,iocharset=utf8 0 0
cowspace /run/archiso/cowspace tmpfs rw,relatime,size=262144k,mode=755,inode64 0 0
/dev/loop0 /run/archiso/airootfs squashfs ro,relatime,errors=continue,threads=single 0 0
airootfs / overlay rw,relatime,lowerdir=/run/archiso/airootfs,upperdir=/run/archiso/cowspace/persistent_ARCH_202510/x86_64/upperdir 0 0
)"sv;

TEST_CASE("block device test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    spdlog::set_default_logger(logger);
    autoinst::logger::set_logger(logger);

    SECTION("classify transport")
    {
        autoinst::disk::DiskInfo disk{.device = "/dev/nvme0n1", .transport = autoinst::disk::DiskTransport::Nvme, .is_rotational = false};
        REQUIRE(installer::classify_transport(disk) == installer::TransportClass::Nvme);

        disk = autoinst::disk::DiskInfo{.device = "/dev/sda", .transport = autoinst::disk::DiskTransport::Sata, .is_rotational = false};
        REQUIRE(installer::classify_transport(disk) == installer::TransportClass::SataSsd);

        disk = autoinst::disk::DiskInfo{.device = "/dev/sda", .transport = autoinst::disk::DiskTransport::Sata, .is_rotational = true};
        REQUIRE(installer::classify_transport(disk) == installer::TransportClass::Rotational);

        // virtio disks report rotational by default
        disk = autoinst::disk::DiskInfo{.device = "/dev/vda", .transport = autoinst::disk::DiskTransport::Virtio, .is_rotational = true};
        REQUIRE(installer::classify_transport(disk) == installer::TransportClass::Other);
    }
    SECTION("inventory from lsblk")
    {
        const auto& inventory = installer::make_inventory(autoinst::disk::parse_lsblk_disks_json(LSBLK_TEST));
        REQUIRE_EQ(inventory.size(), 4);

        REQUIRE_EQ(inventory[0].path, "/dev/sda");
        REQUIRE(inventory[0].transport_class == installer::TransportClass::Rotational);
        REQUIRE_EQ(inventory[0].capacity, 4000787030016ULL);
        REQUIRE_EQ(inventory[0].model, "WDC WD40EFRX");

        REQUIRE_EQ(inventory[1].path, "/dev/sdb");
        REQUIRE(inventory[1].removable);

        REQUIRE(inventory[2].transport_class == installer::TransportClass::SataSsd);
        REQUIRE(inventory[3].transport_class == installer::TransportClass::Nvme);
        REQUIRE_EQ(inventory[3].transport_name, "nvme");
    }
    SECTION("boot medium from mtab")
    {
        const auto& boot_medium = installer::detect_boot_medium(MTAB_TEST);
        REQUIRE(boot_medium.has_value());
        REQUIRE_EQ(*boot_medium, "/dev/sdb");
    }
    SECTION("boot medium on nvme")
    {
        static constexpr auto mtab = "/dev/nvme1n1p1 /run/archiso/bootmnt iso9660 ro,relatime 0 0\n"sv;
        const auto& boot_medium    = installer::detect_boot_medium(mtab);
        REQUIRE(boot_medium.has_value());
        REQUIRE_EQ(*boot_medium, "/dev/nvme1n1");
    }
    SECTION("no boot medium")
    {
        static constexpr auto mtab = "/dev/sda2 / ext4 rw,relatime 0 0\n/dev/sda1 /boot vfat rw,relatime 0 0\n"sv;
        REQUIRE(!installer::detect_boot_medium(mtab).has_value());
    }
}
