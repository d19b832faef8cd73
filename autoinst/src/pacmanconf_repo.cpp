#include "autoinst/pacmanconf_repo.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/string_utils.hpp"


#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto is_repo_header(std::string_view line) noexcept -> bool {
    return !line.empty() && line.starts_with('[') && !line.starts_with("[options]"sv);
}

}  // namespace

namespace autoinst::detail::pacmanconf {

auto push_repos_back(std::string_view file_path, std::string_view value) noexcept -> bool {
    auto&& file_content = file_utils::read_whole_file(file_path);
    if (file_content.empty()) {
        spdlog::error("[PACMANCONFREPO] '{}' error occurred!", file_path);
        return false;
    }

    if (!file_content.ends_with('\n')) {
        file_content += '\n';
    }
    file_content += fmt::format(FMT_COMPILE("\n{}\n"), value);

    if (!file_utils::create_file_for_overwrite(file_path, file_content)) {
        spdlog::error("[PACMANCONFREPO] failed to write '{}'", file_path);
        return false;
    }
    return true;
}

auto uncomment_repo(std::string_view file_path, std::string_view repo_name) noexcept -> bool {
    auto&& file_content = file_utils::read_whole_file(file_path);
    if (file_content.empty()) {
        spdlog::error("[PACMANCONFREPO] '{}' error occurred!", file_path);
        return false;
    }

    const auto& commented_header = fmt::format(FMT_COMPILE("#[{}]"), repo_name);

    std::string new_content{};
    new_content.reserve(file_content.size());

    // walk line by line, keeping empty lines intact
    bool in_section{false};
    bool found{false};
    std::string_view content_view{file_content};
    while (!content_view.empty()) {
        const auto line_end = content_view.find('\n');
        auto line           = content_view.substr(0, line_end);
        content_view.remove_prefix(line_end == std::string_view::npos ? content_view.size() : line_end + 1);

        if (line == commented_header) {
            line.remove_prefix(1);
            in_section = true;
            found      = true;
        } else if (in_section) {
            // section body ends at the first empty line or the next header
            if (line.empty() || is_repo_header(line) || line.starts_with("#["sv)) {
                in_section = false;
            } else if (line.starts_with('#')) {
                line.remove_prefix(1);
            }
        }
        new_content += line;
        if (line_end != std::string_view::npos) {
            new_content += '\n';
        }
    }
    if (!found) {
        spdlog::error("[PACMANCONFREPO] repo '{}' not found in '{}'", repo_name, file_path);
        return false;
    }
    return file_utils::create_file_for_overwrite(file_path, new_content);
}

auto get_repo_list(std::string_view file_path) noexcept -> std::vector<std::string> {
    auto&& file_content = file_utils::read_whole_file(file_path);
    if (file_content.empty()) {
        spdlog::error("[PACMANCONFREPO] '{}' error occurred!", file_path);
        return {};
    }

    std::vector<std::string> repo_list{};
    for (auto&& line : utils::make_split_view(file_content)) {
        if (is_repo_header(line)) {
            repo_list.emplace_back(line);
        }
    }
    return repo_list;
}

}  // namespace autoinst::detail::pacmanconf
