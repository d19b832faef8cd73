#ifndef STAGE_RUNNER_HPP
#define STAGE_RUNNER_HPP

#include "install_profile.hpp"
#include "partition_planner.hpp"

#include <cstdint>      // for uint8_t
#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace installer {

/// Pipeline stages in execution order.
enum class Stage : std::uint8_t {
    Partition,
    Format,
    Mount,
    BaseInstall,
    Configure,
    Bootloader,
    Cleanup
};

enum class FailureCause : std::uint8_t {
    DeviceBusy,
    CommandFailed,
    NetworkUnavailable,
    MissingFile,
    InvalidState
};

struct StageOutcome final {
    bool success{true};
    FailureCause cause{FailureCause::CommandFailed};
    std::string detail{};

    static auto ok() noexcept -> StageOutcome { return StageOutcome{}; }
    static auto failure(FailureCause cause, std::string detail) noexcept -> StageOutcome {
        return StageOutcome{.success = false, .cause = cause, .detail = std::move(detail)};
    }
};

[[nodiscard]] auto stage_to_string(Stage stage) noexcept -> std::string_view;
[[nodiscard]] auto failure_cause_to_string(FailureCause cause) noexcept -> std::string_view;

using ProgressCallback = std::function<void(std::string_view)>;

/// The external work behind each pipeline stage.
/// The pipeline only decides what runs when, implementations do the actual work.
class StageRunner {
 public:
    virtual ~StageRunner() = default;

    /// Erases the device and writes the partition table.
    virtual auto partition(const PartitionPlan& plan) noexcept -> StageOutcome = 0;
    virtual auto format(const PartitionPlan& plan) noexcept -> StageOutcome = 0;

    /// Mounts root first, then ESP under it.
    /// Every directory mounted successfully is appended to mounted, even if the stage fails later.
    virtual auto mount(const PartitionPlan& plan, std::string_view mountpoint, std::vector<std::string>& mounted) noexcept -> StageOutcome = 0;

    /// Single attempt, retries are decided by the pipeline.
    virtual auto base_install(const InstallProfile& profile, std::string_view mountpoint, const ProgressCallback& progress) noexcept -> StageOutcome = 0;
    virtual auto configure(const InstallProfile& profile, std::string_view mountpoint) noexcept -> StageOutcome = 0;
    virtual auto install_bootloader(const PartitionPlan& plan, const InstallProfile& profile, std::string_view mountpoint) noexcept -> StageOutcome = 0;

    /// Unmounts directories in the given order.
    virtual auto cleanup(const std::vector<std::string>& mountpoints) noexcept -> StageOutcome = 0;
};

}  // namespace installer

#endif  // STAGE_RUNNER_HPP
