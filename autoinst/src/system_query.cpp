#include "autoinst/system_query.hpp"
#include "autoinst/io_utils.hpp"

#include <charconv>      // for from_chars
#include <system_error>  // for errc
#include <utility>       // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto DEV_PATH_PREFIX  = "/dev/"sv;
static constexpr auto TRAILING_NUMBERS = "0123456789"sv;
static constexpr auto LSBLK_COLUMNS    = "NAME,TYPE,SIZE,MODEL,FSTYPE,UUID,PARTUUID,MOUNTPOINT,RM,RO,ROTA,TRAN"sv;

namespace {

/// Determines transport type from device path and tran field
auto determine_transport(std::string_view device, std::string_view tran) noexcept -> autoinst::disk::DiskTransport {
    using autoinst::disk::DiskTransport;

    if (!tran.empty()) {
        const auto transport = autoinst::disk::string_to_disk_transport(tran);
        if (transport != DiskTransport::Unknown) {
            return transport;
        }
    }

    if (device.contains("nvme"sv)) {
        return DiskTransport::Nvme;
    } else if (device.contains("/vd"sv)) {
        return DiskTransport::Virtio;
    }

    return DiskTransport::Unknown;
}

// lsblk prints flags as json booleans, older util-linux as "0"/"1" strings
auto get_flag(const rapidjson::Value& doc, const char* key) noexcept -> std::optional<bool> {
    if (!doc.HasMember(key)) {
        return std::nullopt;
    }
    const auto& value = doc[key];
    if (value.IsBool()) {
        return value.GetBool();
    }
    if (value.IsString()) {
        return std::string_view{value.GetString()} == "1"sv;
    }
    if (value.IsInt()) {
        return value.GetInt() != 0;
    }
    return std::nullopt;
}

// same story for sizes
auto get_size(const rapidjson::Value& doc) noexcept -> std::uint64_t {
    if (!doc.HasMember("size")) {
        return 0;
    }
    const auto& value = doc["size"];
    if (value.IsUint64()) {
        return value.GetUint64();
    }
    if (value.IsString()) {
        const std::string_view size_str{value.GetString(), value.GetStringLength()};
        std::uint64_t result{0};
        const auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), result);
        if (ec != std::errc{} || ptr != size_str.data() + size_str.size()) {
            return 0;
        }
        return result;
    }
    return 0;
}

auto get_partition_from_json(const rapidjson::Value& doc) -> autoinst::disk::PartitionInfo {
    autoinst::disk::PartitionInfo part{};

    if (doc.HasMember("name") && doc["name"].IsString()) {
        part.device = doc["name"].GetString();
    }
    if (doc.HasMember("fstype") && doc["fstype"].IsString()) {
        part.fstype = doc["fstype"].GetString();
    }
    if (doc.HasMember("uuid") && doc["uuid"].IsString()) {
        part.uuid = doc["uuid"].GetString();
    }
    if (doc.HasMember("partuuid") && doc["partuuid"].IsString()) {
        part.partuuid = doc["partuuid"].GetString();
    }
    part.size = get_size(doc);
    if (doc.HasMember("mountpoint") && doc["mountpoint"].IsString()) {
        part.mountpoint = doc["mountpoint"].GetString();
        part.is_mounted = true;
    }

    return part;
}

auto get_disk_from_json(const rapidjson::Value& doc) -> autoinst::disk::DiskInfo {
    autoinst::disk::DiskInfo disk{};

    if (doc.HasMember("name") && doc["name"].IsString()) {
        disk.device = doc["name"].GetString();
    }
    if (doc.HasMember("model") && doc["model"].IsString()) {
        disk.model = doc["model"].GetString();
    }
    if (doc.HasMember("mountpoint") && doc["mountpoint"].IsString()) {
        disk.mountpoint = doc["mountpoint"].GetString();
    }
    disk.size         = get_size(doc);
    disk.is_removable = get_flag(doc, "rm").value_or(false);
    disk.is_read_only = get_flag(doc, "ro").value_or(false);

    std::string_view tran{};
    if (doc.HasMember("tran") && doc["tran"].IsString()) {
        tran = doc["tran"].GetString();
    }
    disk.transport = determine_transport(disk.device, tran);

    // unknown rotational state is treated as a spinning disk
    disk.is_rotational = get_flag(doc, "rota").value_or(true);

    // Parse children (partitions)
    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child : doc["children"].GetArray()) {
            if (child.HasMember("type") && child["type"].IsString()) {
                std::string_view child_type = child["type"].GetString();
                if (child_type == "part"sv) {
                    disk.partitions.emplace_back(get_partition_from_json(child));
                }
            }
        }
    }

    return disk;
}

}  // namespace

namespace autoinst::disk {

auto get_disk_name_from_device(std::string_view device) noexcept -> std::string_view {
    if (device.starts_with(DEV_PATH_PREFIX)) {
        device.remove_prefix(DEV_PATH_PREFIX.size());
    }

    // nvme0n1p2, mmcblk0p1 -> strip partition suffix after 'p'
    if (device.starts_with("nvme"sv) || device.starts_with("mmcblk"sv)) {
        if (auto pos = device.find_last_of('p'); pos != std::string_view::npos && pos > 4) {
            return device.substr(0, pos);
        }
        return device;
    }

    auto pos = device.find_last_not_of(TRAILING_NUMBERS);
    return (pos != std::string_view::npos) ? device.substr(0, pos + 1) : device;
}

auto make_partition_device(std::string_view disk_device, std::uint32_t part_number) noexcept -> std::string {
    // kernel naming: a 'p' separator is used when the disk name ends with a digit
    if (!disk_device.empty() && TRAILING_NUMBERS.contains(disk_device.back())) {
        return fmt::format(FMT_COMPILE("{}p{}"), disk_device, part_number);
    }
    return fmt::format(FMT_COMPILE("{}{}"), disk_device, part_number);
}

auto disk_transport_to_string(DiskTransport transport) noexcept -> std::string_view {
    switch (transport) {
    case DiskTransport::Sata:
        return "sata"sv;
    case DiskTransport::Nvme:
        return "nvme"sv;
    case DiskTransport::Usb:
        return "usb"sv;
    case DiskTransport::Scsi:
        return "scsi"sv;
    case DiskTransport::Virtio:
        return "virtio"sv;
    case DiskTransport::Unknown:
    default:
        return "unknown"sv;
    }
}

auto string_to_disk_transport(std::string_view transport_str) noexcept -> DiskTransport {
    if (transport_str == "sata"sv || transport_str == "ata"sv) {
        return DiskTransport::Sata;
    } else if (transport_str == "nvme"sv) {
        return DiskTransport::Nvme;
    } else if (transport_str == "usb"sv) {
        return DiskTransport::Usb;
    } else if (transport_str == "scsi"sv || transport_str == "sas"sv) {
        return DiskTransport::Scsi;
    } else if (transport_str == "virtio"sv) {
        return DiskTransport::Virtio;
    }
    return DiskTransport::Unknown;
}

auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo> {
    if (json_output.empty()) {
        return {};
    }

    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());

    // Check for parse errors and ensure document is a valid object
    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return {};
    }
    if (document.IsNull() || !document.IsObject()) {
        spdlog::error("lsblk output is not a valid JSON object");
        return {};
    }

    std::vector<DiskInfo> disks{};
    if (document.HasMember("blockdevices") && document["blockdevices"].IsArray()) {
        for (const auto& device_json : document["blockdevices"].GetArray()) {
            if (device_json.HasMember("type") && device_json["type"].IsString()) {
                std::string_view dev_type = device_json["type"].GetString();
                if (dev_type == "disk"sv) {
                    auto disk = get_disk_from_json(device_json);
                    disks.emplace_back(std::move(disk));
                }
            }
        }
    }
    return disks;
}

auto list_disks() noexcept -> std::optional<std::vector<DiskInfo>> {
    const auto& lsblk_output = utils::exec(fmt::format(FMT_COMPILE("lsblk -J -b -p -o {}"), LSBLK_COLUMNS));
    if (lsblk_output.empty()) {
        spdlog::error("Failed to get lsblk output");
        return std::nullopt;
    }

    auto disks = parse_lsblk_disks_json(lsblk_output);
    if (disks.empty()) {
        spdlog::warn("No disks found from lsblk");
    }

    return std::make_optional<std::vector<DiskInfo>>(std::move(disks));
}

auto format_size(std::uint64_t bytes) noexcept -> std::string {
    constexpr std::uint64_t KiB = 1024ULL;
    constexpr std::uint64_t MiB = KiB * 1024;
    constexpr std::uint64_t GiB = MiB * 1024;
    constexpr std::uint64_t TiB = GiB * 1024;

    if (bytes >= TiB) {
        return fmt::format(FMT_COMPILE("{:.1f}TiB"), static_cast<double>(bytes) / TiB);
    } else if (bytes >= GiB) {
        return fmt::format(FMT_COMPILE("{:.1f}GiB"), static_cast<double>(bytes) / GiB);
    } else if (bytes >= MiB) {
        return fmt::format(FMT_COMPILE("{:.0f}MiB"), static_cast<double>(bytes) / MiB);
    } else if (bytes >= KiB) {
        return fmt::format(FMT_COMPILE("{:.0f}KiB"), static_cast<double>(bytes) / KiB);
    }
    return fmt::format(FMT_COMPILE("{}B"), bytes);
}

}  // namespace autoinst::disk
