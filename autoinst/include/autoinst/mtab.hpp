#ifndef AUTOINST_MTAB_HPP
#define AUTOINST_MTAB_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::mtab {

struct MTabEntry {
    std::string device{};
    std::string mountpoint{};
    std::string fstype{};
};

// Read mtab, its reported size is zero
auto read_mtab(std::string_view mtab_path = "/etc/mtab") noexcept -> std::optional<std::string>;

// Parse mtab, keeping entries mounted at or below root_mountpoint
auto parse_mtab(std::string_view root_mountpoint, std::string_view mtab_path = "/etc/mtab") noexcept -> std::optional<std::vector<MTabEntry>>;

// Parse mtab content
auto parse_mtab_content(std::string_view mtab_content, std::string_view root_mountpoint) noexcept -> std::vector<MTabEntry>;

// Find the device mounted exactly at mountpoint
auto find_mountpoint_source(std::string_view mtab_content, std::string_view mountpoint) noexcept -> std::optional<std::string>;

}  // namespace autoinst::mtab

#endif  // AUTOINST_MTAB_HPP
