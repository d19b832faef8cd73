#include "orchestrator.hpp"
#include "definitions.hpp"
#include "disk_selector.hpp"
#include "partition_planner.hpp"
#include "pipeline.hpp"
#include "session.hpp"

// import autoinst
#include "autoinst/system_query.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace installer {

void print_inventory(const DeviceInventory& inventory) noexcept {
    output_inter("Detected disks:\n");
    for (const auto& device : inventory) {
        output_inter(" - {:>14} | size: {:>9} | type: {:>10} | transport: {:>6} | model: {}\n", device.path,
            autoinst::disk::format_size(device.capacity), transport_class_to_string(device.transport_class),
            device.transport_name.empty() ? "n/a"sv : std::string_view{device.transport_name},
            device.model.empty() ? "n/a"sv : std::string_view{device.model});
    }
}

auto run_installation(const DeviceInventory& inventory, const std::optional<std::string>& boot_medium,
    const InstallProfile& profile, Confirmer& confirmer, StageRunner& runner, const ProgressCallback& progress) noexcept -> ExitCode {
    const auto& selection = select_target_device(inventory, boot_medium);
    if (!selection) {
        error_inter("No eligible disk found for installation.\n");
        return ExitCode::SelectionFailure;
    }
    const auto& target = selection->device;
    info_inter("Selected disk: {} ({}) [{}]\n", target.path, autoinst::disk::format_size(target.capacity), selection->reason);

    auto plan = plan_partitions(target.path, target.capacity);
    if (!plan) {
        error_inter("{} is too small: {} available, {} required.\n", target.path,
            autoinst::disk::format_size(target.capacity), autoinst::disk::format_size(minimum_capacity()));
        return ExitCode::PlanningFailure;
    }

    ConfirmationGate gate{confirmer};
    const auto& consent = gate.request_consent(target, *plan);
    if (!consent) {
        warning_inter("Installation aborted, {} was not touched.\n", target.path);
        return ExitCode::UserAbort;
    }

    InstallationSession session{.device = target, .plan = std::move(*plan)};
    ProvisioningPipeline pipeline{runner, profile};
    if (!pipeline.run(*consent, session, progress)) {
        std::vector<std::string_view> completed{};
        for (const auto stage : session.completed) {
            completed.push_back(stage_to_string(stage));
        }
        if (session.failure) {
            error_inter("Installation failed at stage {}: {} ({})\n", stage_to_string(session.failure->stage),
                failure_cause_to_string(session.failure->cause), session.failure->detail);
        }
        error_inter("Completed stages: {}\n", completed.empty() ? std::string{"none"} : fmt::format("{}", fmt::join(completed, ", ")));
        return ExitCode::PipelineFailure;
    }

    success_inter("Installation onto {} finished.\n", target.path);
    return ExitCode::Success;
}

}  // namespace installer
