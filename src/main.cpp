#include "block_device.hpp"       // for snapshot_inventory, find_boot_medium
#include "confirmation_gate.hpp"  // for ConsoleConfirmer
#include "definitions.hpp"        // for error_inter
#include "install_profile.hpp"    // for load_install_profile
#include "orchestrator.hpp"       // for run_installation
#include "preflight.hpp"          // for run_preflight_checks
#include "system_stage_runner.hpp"

// import autoinst
#include "autoinst/io_utils.hpp"
#include "autoinst/logger.hpp"

#include <chrono>  // for seconds
#include <regex>   // for regex_search

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

namespace {

inline auto finish(installer::ExitCode exit_code) noexcept -> int {
    spdlog::info("Exiting with status {}", static_cast<int>(exit_code));
    spdlog::shutdown();
    return static_cast<int>(exit_code);
}

}  // namespace

int main() {
    const auto& tty = autoinst::utils::exec("tty");
    const std::regex tty_regex("/dev/tty[0-9]*");
    if (std::regex_search(tty, tty_regex)) {
        autoinst::utils::exec("setterm -blank 0 -powersave off");
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("autoinst_logger", "/tmp/autoinst-install.log");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set autoinst logger.
    autoinst::logger::set_logger(logger);

    output_inter("Custom-Archlinux Installer\n");
    output_inter("--------------------------\n");

    if (!installer::run_preflight_checks()) {
        return finish(installer::ExitCode::PreflightFailure);
    }

    const auto& profile_path = installer::find_profile_path();
    if (!profile_path) {
        error_inter("No install profile found, set AUTOINST_PROFILE or provide /etc/autoinst/profile.toml.\n");
        return finish(installer::ExitCode::PreflightFailure);
    }
    const auto& profile = installer::load_install_profile(*profile_path);
    if (!profile) {
        error_inter("Install profile {} is invalid, see /tmp/autoinst-install.log.\n", *profile_path);
        return finish(installer::ExitCode::PreflightFailure);
    }

    const auto& inventory = installer::snapshot_inventory();
    if (!inventory || inventory->empty()) {
        error_inter("No block devices detected.\n");
        return finish(installer::ExitCode::SelectionFailure);
    }
    installer::print_inventory(*inventory);

    installer::ConsoleConfirmer confirmer{};
    installer::SystemStageRunner runner{};
    const auto& progress = [](std::string_view line) { output_inter("{}\n", line); };

    const auto exit_code = installer::run_installation(*inventory, installer::find_boot_medium(), *profile, confirmer, runner, progress);
    if (exit_code != installer::ExitCode::Success) {
        return finish(exit_code);
    }

    if (confirmer.confirm("Installation complete. Reboot now? [y/N] ")) {
        spdlog::shutdown();
        autoinst::utils::exec("systemctl reboot", true);
        return 0;
    }
    return finish(installer::ExitCode::Success);
}
