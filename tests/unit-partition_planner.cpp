#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "partition_planner.hpp"

// import autoinst
#include "autoinst/logger.hpp"
#include "autoinst/partitioning.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

TEST_CASE("partition planner test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    spdlog::set_default_logger(logger);
    autoinst::logger::set_logger(logger);

    using installer::MiB;

    SECTION("esp and root layout")
    {
        static constexpr std::uint64_t capacity = 512110190592ULL;
        const auto& plan = installer::plan_partitions("/dev/nvme0n1"sv, capacity);
        REQUIRE(plan.has_value());
        REQUIRE_EQ(plan->device, "/dev/nvme0n1");
        REQUIRE_EQ(plan->partitions.size(), 2);

        const auto& esp = plan->partitions[0];
        REQUIRE(esp.role == installer::PartitionRole::Esp);
        REQUIRE(esp.fstype == autoinst::fs::FilesystemType::Vfat);
        REQUIRE_EQ(esp.mountpoint, "/boot");
        REQUIRE_EQ(esp.device, "/dev/nvme0n1p1");
        REQUIRE_EQ(esp.offset, 1 * MiB);
        REQUIRE_EQ(esp.size, installer::ESP_SIZE_MIB * MiB);
        REQUIRE(!esp.is_remainder);

        const auto& root = plan->partitions[1];
        REQUIRE(root.role == installer::PartitionRole::Root);
        REQUIRE(root.fstype == autoinst::fs::FilesystemType::Ext4);
        REQUIRE_EQ(root.mountpoint, "/");
        REQUIRE_EQ(root.device, "/dev/nvme0n1p2");
        REQUIRE_EQ(root.offset, esp.offset + esp.size);
        REQUIRE(root.is_remainder);
        REQUIRE_EQ(root.offset + root.size + installer::END_RESERVE_MIB * MiB, (capacity / MiB) * MiB);
    }
    SECTION("sizes never exceed capacity")
    {
        for (std::uint64_t capacity = installer::minimum_capacity(); capacity < 2 * installer::minimum_capacity(); capacity += 7919 * 1024) {
            const auto& plan = installer::plan_partitions("/dev/sda"sv, capacity);
            REQUIRE(plan.has_value());
            REQUIRE_LE(installer::planned_size(*plan), capacity);
            REQUIRE_LE(plan->partitions.back().offset + plan->partitions.back().size, capacity);
            REQUIRE_EQ(plan->partitions.front().size, installer::ESP_SIZE_MIB * MiB);
            REQUIRE_GE(plan->partitions.back().size, installer::MIN_ROOT_SIZE_MIB * MiB);
        }
    }
    SECTION("exactly minimum capacity")
    {
        const auto& plan = installer::plan_partitions("/dev/sda"sv, installer::minimum_capacity());
        REQUIRE(plan.has_value());
        REQUIRE_EQ(plan->partitions[1].size, installer::MIN_ROOT_SIZE_MIB * MiB);
    }
    SECTION("insufficient capacity")
    {
        REQUIRE(!installer::plan_partitions("/dev/sda"sv, 2048 * MiB).has_value());
        REQUIRE(!installer::plan_partitions("/dev/sda"sv, installer::minimum_capacity() - 1).has_value());
        REQUIRE(!installer::plan_partitions("/dev/sda"sv, 0).has_value());
    }
    SECTION("sfdisk schema")
    {
        const auto& plan = installer::plan_partitions("/dev/sda"sv, 10240 * MiB);
        REQUIRE(plan.has_value());

        const auto& partitions = installer::to_partition_schema(*plan);
        REQUIRE_EQ(partitions.size(), 2);
        REQUIRE_EQ(partitions[0].device, "/dev/sda1");
        REQUIRE_EQ(partitions[0].start, "1MiB");
        REQUIRE_EQ(partitions[0].size, "1024MiB");
        REQUIRE_EQ(partitions[1].device, "/dev/sda2");
        REQUIRE_EQ(partitions[1].start, "1025MiB");
        REQUIRE_EQ(partitions[1].size, "9214MiB");

        static constexpr auto expected_script = "label: gpt\n"
                                                "type=U,start=1MiB,size=1024MiB\n"
                                                "type=L,start=1025MiB,size=9214MiB\n"sv;
        REQUIRE_EQ(autoinst::disk::gen_sfdisk_command(partitions), expected_script);
    }
    SECTION("find partition by role")
    {
        const auto& plan = installer::plan_partitions("/dev/vda"sv, 20480 * MiB);
        REQUIRE(plan.has_value());
        const auto& esp = installer::find_partition(*plan, installer::PartitionRole::Esp);
        REQUIRE(esp.has_value());
        REQUIRE_EQ(esp->device, "/dev/vda1");
        REQUIRE(!installer::find_partition(installer::PartitionPlan{}, installer::PartitionRole::Root).has_value());
    }
}
