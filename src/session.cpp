#include "session.hpp"

using namespace std::string_view_literals;

namespace installer {

auto stage_to_string(Stage stage) noexcept -> std::string_view {
    switch (stage) {
    case Stage::Partition:
        return "Partition"sv;
    case Stage::Format:
        return "Format"sv;
    case Stage::Mount:
        return "Mount"sv;
    case Stage::BaseInstall:
        return "BaseInstall"sv;
    case Stage::Configure:
        return "Configure"sv;
    case Stage::Bootloader:
        return "Bootloader"sv;
    case Stage::Cleanup:
        return "Cleanup"sv;
    }
    return "Unknown"sv;
}

auto failure_cause_to_string(FailureCause cause) noexcept -> std::string_view {
    switch (cause) {
    case FailureCause::DeviceBusy:
        return "DeviceBusy"sv;
    case FailureCause::CommandFailed:
        return "CommandFailed"sv;
    case FailureCause::NetworkUnavailable:
        return "NetworkUnavailable"sv;
    case FailureCause::MissingFile:
        return "MissingFile"sv;
    case FailureCause::InvalidState:
        return "InvalidState"sv;
    }
    return "Unknown"sv;
}

auto pipeline_state_to_string(PipelineState state) noexcept -> std::string_view {
    switch (state) {
    case PipelineState::Unpartitioned:
        return "Unpartitioned"sv;
    case PipelineState::Partitioned:
        return "Partitioned"sv;
    case PipelineState::Formatted:
        return "Formatted"sv;
    case PipelineState::Mounted:
        return "Mounted"sv;
    case PipelineState::BaseInstalled:
        return "BaseInstalled"sv;
    case PipelineState::Configured:
        return "Configured"sv;
    case PipelineState::BootloaderInstalled:
        return "BootloaderInstalled"sv;
    case PipelineState::Cleaned:
        return "Cleaned"sv;
    case PipelineState::Failed:
        return "Failed"sv;
    }
    return "Unknown"sv;
}

auto state_after(Stage stage) noexcept -> PipelineState {
    switch (stage) {
    case Stage::Partition:
        return PipelineState::Partitioned;
    case Stage::Format:
        return PipelineState::Formatted;
    case Stage::Mount:
        return PipelineState::Mounted;
    case Stage::BaseInstall:
        return PipelineState::BaseInstalled;
    case Stage::Configure:
        return PipelineState::Configured;
    case Stage::Bootloader:
        return PipelineState::BootloaderInstalled;
    case Stage::Cleanup:
        return PipelineState::Cleaned;
    }
    return PipelineState::Failed;
}

}  // namespace installer
