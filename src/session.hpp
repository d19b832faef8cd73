#ifndef SESSION_HPP
#define SESSION_HPP

#include "block_device.hpp"
#include "partition_planner.hpp"
#include "stage_runner.hpp"

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace installer {

enum class PipelineState : std::uint8_t {
    Unpartitioned,
    Partitioned,
    Formatted,
    Mounted,
    BaseInstalled,
    Configured,
    BootloaderInstalled,
    Cleaned,
    Failed
};

[[nodiscard]] auto pipeline_state_to_string(PipelineState state) noexcept -> std::string_view;

/// State reached once the stage succeeds.
[[nodiscard]] auto state_after(Stage stage) noexcept -> PipelineState;

struct StageFailure final {
    Stage stage{};
    FailureCause cause{};
    std::string detail{};
};

/// Everything known about the ongoing installation. Lives in memory only.
struct InstallationSession final {
    BlockDevice device{};
    PartitionPlan plan{};
    PipelineState state{PipelineState::Unpartitioned};
    /// stages which finished successfully, in order
    std::vector<Stage> completed{};
    /// mounted directories, in mount order
    std::vector<std::string> mounted{};
    std::optional<StageFailure> failure{};
};

}  // namespace installer

#endif  // SESSION_HPP
