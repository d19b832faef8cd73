#include "autoinst/file_utils.hpp"
#include "autoinst/string_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fseek
#include <cstring>  // for strerror

#include <filesystem>  // for create_directories
#include <fstream>     // for ifstream, ofstream
#include <utility>     // for move
#include <vector>      // for vector

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace autoinst::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    const std::string filepath_str{filepath};

    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(filepath_str.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0u, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0u, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

auto read_virtual_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    std::ifstream file(fs::path{filepath}, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::vector<std::string> lines{};
    std::string line{};
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return std::make_optional<std::string>(utils::join(lines));
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    const fs::path file_path{filepath};

    std::error_code err{};
    if (file_path.has_parent_path()) {
        fs::create_directories(file_path.parent_path(), err);
        if (err) {
            spdlog::error("[CREATE_FILE] failed to create parent of '{}': {}", filepath, err.message());
            return false;
        }
    }

    std::ofstream file{file_path, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[CREATE_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    return file.good();
}

}  // namespace autoinst::file_utils
