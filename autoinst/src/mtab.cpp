#include "autoinst/mtab.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/string_utils.hpp"

#include <utility>     // for move

using namespace std::string_view_literals;

namespace {

// mountpoints with spaces are escaped as \040 by the kernel
auto unescape_mountpoint(std::string_view mountpoint) noexcept -> std::string {
    std::string result{};
    result.reserve(mountpoint.size());
    for (std::size_t i = 0; i < mountpoint.size(); ++i) {
        if (mountpoint.substr(i).starts_with("\\040"sv)) {
            result += ' ';
            i += 3;
            continue;
        }
        result += mountpoint[i];
    }
    return result;
}

}  // namespace

namespace autoinst::mtab {

auto read_mtab(std::string_view mtab_path) noexcept -> std::optional<std::string> {
    return file_utils::read_virtual_file(mtab_path);
}

auto parse_mtab_content(std::string_view mtab_content, std::string_view root_mountpoint) noexcept -> std::vector<MTabEntry> {
    std::vector<MTabEntry> entries{};

    auto&& file_content_lines = utils::make_split_view(mtab_content);
    for (auto&& line : file_content_lines) {
        if (line.empty() || line.starts_with('#')) {
            continue;
        }

        auto&& line_split = utils::make_split_view(line, ' ');
        if (utils::size_viewable_range(line_split) < 3) {
            continue;
        }

        // e.g format: <device> <mountpoint> <fstype> <options>
        auto&& device     = *utils::index_viewable_range(line_split, 0);
        auto&& mountpoint = unescape_mountpoint(*utils::index_viewable_range(line_split, 1));
        auto&& fstype     = *utils::index_viewable_range(line_split, 2);
        if (mountpoint.starts_with(root_mountpoint)) {
            entries.emplace_back(MTabEntry{.device = std::string{device}, .mountpoint = std::move(mountpoint), .fstype = std::string{fstype}});
        }
    }
    return entries;
}

auto parse_mtab(std::string_view root_mountpoint, std::string_view mtab_path) noexcept -> std::optional<std::vector<MTabEntry>> {
    // mountpoint and mtab paths cannot be empty
    if (root_mountpoint.empty() || mtab_path.empty()) {
        return std::nullopt;
    }

    // use "non-standard" read due to reported zero size
    auto&& file_content = read_mtab(mtab_path);
    if (!file_content || file_content->empty()) {
        return std::nullopt;
    }
    return mtab::parse_mtab_content(*file_content, root_mountpoint);
}

auto find_mountpoint_source(std::string_view mtab_content, std::string_view mountpoint) noexcept -> std::optional<std::string> {
    for (auto&& entry : mtab::parse_mtab_content(mtab_content, mountpoint)) {
        if (entry.mountpoint == mountpoint) {
            return std::make_optional<std::string>(std::move(entry.device));
        }
    }
    return std::nullopt;
}

}  // namespace autoinst::mtab
