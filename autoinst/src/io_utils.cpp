#include "autoinst/io_utils.hpp"
#include "autoinst/string_utils.hpp"

#include <sys/wait.h>  // for WEXITSTATUS, WIFEXITED

#include <cstdint>  // for int32_t
#include <cstdio>   // for feof, fgets, pclose, popen
#include <cstdlib>  // for getenv, system

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

inline auto is_success_status(std::int32_t status) noexcept -> bool {
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

auto log_exec_cmds() noexcept -> bool {
    return autoinst::utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
}

auto dirty_cmd_run() noexcept -> bool {
    return autoinst::utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;
}

}  // namespace

namespace autoinst::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = std::getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto exec(std::string_view command, bool interactive) noexcept -> std::string {
    if (log_exec_cmds() && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }

    const std::string command_str{command};
    if (interactive) {
        const auto& ret_code = std::system(command_str.c_str());
        return std::to_string(ret_code);
    }

    const std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_str.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", command);
        return "-1";
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!std::feof(pipe.get())) {
        if (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }

    return result;
}

auto exec_checked(std::string_view command) noexcept -> bool {
    if (log_exec_cmds() && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_checked] cmd := '{}'", command);
    }
    if (dirty_cmd_run()) {
        return true;
    }

    const std::string command_str{command};
    return is_success_status(std::system(command_str.c_str()));
}

auto exec_follow(std::string_view command, const LineCallback& line_callback) noexcept -> bool {
    if (log_exec_cmds() && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_follow] cmd := '{}'", command);
    }
    if (dirty_cmd_run()) {
        return true;
    }

    // combine stderr into the followed stream
    const auto& command_str = fmt::format(FMT_COMPILE("{} 2>&1"), command);

    auto* pipe = popen(command_str.c_str(), "r");
    if (pipe == nullptr) {
        spdlog::error("[exec_follow] popen failed! '{}'", command);
        return false;
    }

    std::string line{};
    std::array<char, 512> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        line += buffer.data();
        if (!line.ends_with('\n')) {
            // line longer than buffer, keep reading
            continue;
        }
        line.pop_back();
        if (line_callback) {
            line_callback(line);
        }
        line.clear();
    }
    if (!line.empty() && line_callback) {
        line_callback(line);
    }

    const auto status = pclose(pipe);
    if (!is_success_status(status)) {
        spdlog::error("[exec_follow] '{}' exited with status {}", command, status);
        return false;
    }
    return true;
}

auto arch_chroot_checked(std::string_view command, std::string_view mountpoint) noexcept -> bool {
    const auto& cmd_formatted = fmt::format(FMT_COMPILE("arch-chroot {} {} >>/tmp/autoinst-install.log 2>&1"), mountpoint, command);
    spdlog::info("Running with arch-chroot: '{}'", cmd_formatted);
    return utils::exec_checked(cmd_formatted);
}

auto arch_chroot_user_checked(std::string_view command, std::string_view username, std::string_view mountpoint) noexcept -> bool {
    // login shell, so HOME and the user environment point into the target
    const auto& cmd_formatted = fmt::format(FMT_COMPILE("arch-chroot {} su - {} -c {} >>/tmp/autoinst-install.log 2>&1"), mountpoint, username, utils::shell_quote(command));
    spdlog::info("Running with arch-chroot as '{}': '{}'", username, cmd_formatted);
    return utils::exec_checked(cmd_formatted);
}

}  // namespace autoinst::utils
