#include "autoinst/partition.hpp"

using namespace std::string_view_literals;

namespace autoinst::fs {

auto filesystem_type_to_string(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Ext4:
        return "ext4"sv;
    case FilesystemType::Vfat:
        return "vfat"sv;
    case FilesystemType::Unknown:
    default:
        return "unknown"sv;
    }
}

auto string_to_filesystem_type(std::string_view fs_name) noexcept -> FilesystemType {
    if (fs_name == "ext4"sv) {
        return FilesystemType::Ext4;
    } else if (fs_name == "vfat"sv || fs_name == "fat32"sv) {
        return FilesystemType::Vfat;
    }
    return FilesystemType::Unknown;
}

auto get_mkfs_command(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Ext4:
        // -F: the target was just partitioned, don't ask about leftovers
        return "mkfs.ext4 -F"sv;
    case FilesystemType::Vfat:
        return "mkfs.vfat -F32"sv;
    case FilesystemType::Unknown:
    default:
        return ""sv;
    }
}

auto get_sfdisk_type_alias(FilesystemType fs_type) noexcept -> std::string_view {
    // see https://man.archlinux.org/man/sfdisk.8 for supported aliases
    switch (fs_type) {
    case FilesystemType::Vfat:
        // EFI System partition, C12A7328-F81F-11D2-BA4B-00A0C93EC93B for GPT
        return "U"sv;
    case FilesystemType::Ext4:
    case FilesystemType::Unknown:
    default:
        // Linux; 0FC63DAF-8483-4772-8E79-3D69D8477DE4 for GPT.
        return "L"sv;
    }
}

}  // namespace autoinst::fs
