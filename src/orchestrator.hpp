#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "block_device.hpp"
#include "confirmation_gate.hpp"
#include "install_profile.hpp"
#include "stage_runner.hpp"

#include <cstdint>   // for int32_t
#include <optional>  // for optional
#include <string>    // for string

namespace installer {

/// Process exit status, one per failure class.
enum class ExitCode : std::int32_t {
    Success          = 0,
    PreflightFailure = 1,
    SelectionFailure = 2,
    PlanningFailure  = 3,
    UserAbort        = 4,
    PipelineFailure  = 5
};

/// Prints the detected disks to the operator.
void print_inventory(const DeviceInventory& inventory) noexcept;

/// Selects the target, plans it, asks for consent and runs the pipeline.
/// Nothing is written to storage unless the operator agrees.
auto run_installation(const DeviceInventory& inventory, const std::optional<std::string>& boot_medium,
    const InstallProfile& profile, Confirmer& confirmer, StageRunner& runner, const ProgressCallback& progress = {}) noexcept -> ExitCode;

}  // namespace installer

#endif  // ORCHESTRATOR_HPP
