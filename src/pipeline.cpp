#include "pipeline.hpp"

#include <algorithm>  // for max
#include <cstdint>    // for int32_t
#include <string>     // for string
#include <thread>     // for sleep_for
#include <utility>    // for move
#include <vector>     // for vector

#include <spdlog/spdlog.h>

namespace installer {

auto ProvisioningPipeline::run(const Consent& consent, InstallationSession& session, const ProgressCallback& progress) noexcept -> bool {
    if (m_started) {
        spdlog::error("Pipeline was already run");
        return false;
    }
    m_started = true;

    const auto& mountpoint = m_profile.mountpoint;

    bool stages_ok{true};
    if (consent.device() != session.device.path || session.plan.device != session.device.path) {
        spdlog::error("Consent was given for '{}', but the session targets '{}'", consent.device(), session.device.path);
        session.failure = StageFailure{.stage = Stage::Partition, .cause = FailureCause::InvalidState, .detail = "consent doesn't match target device"};
        session.state   = PipelineState::Failed;
        stages_ok       = false;
    } else if (session.state != PipelineState::Unpartitioned) {
        spdlog::error("Pipeline can't start from state {}", pipeline_state_to_string(session.state));
        session.failure = StageFailure{.stage = Stage::Partition, .cause = FailureCause::InvalidState, .detail = "session already progressed"};
        session.state   = PipelineState::Failed;
        stages_ok       = false;
    }

    // point of no return is the partition stage
    stages_ok = stages_ok
        && run_stage(session, Stage::Partition, [&] { return m_runner.partition(session.plan); })
        && run_stage(session, Stage::Format, [&] { return m_runner.format(session.plan); })
        && run_stage(session, Stage::Mount, [&] { return m_runner.mount(session.plan, mountpoint, session.mounted); })
        && run_stage(session, Stage::BaseInstall, [&] { return install_base_system(progress); })
        && run_stage(session, Stage::Configure, [&] { return m_runner.configure(m_profile, mountpoint); })
        && run_stage(session, Stage::Bootloader, [&] { return m_runner.install_bootloader(session.plan, m_profile, mountpoint); });

    run_cleanup(session);
    return stages_ok && !session.failure.has_value();
}

auto ProvisioningPipeline::install_base_system(const ProgressCallback& progress) noexcept -> StageOutcome {
    if (m_base_install_running.exchange(true)) {
        spdlog::error("Base install is already running");
        return StageOutcome::failure(FailureCause::InvalidState, "base install is already running");
    }

    const auto attempts = std::max(1, m_profile.base_install_attempts);
    StageOutcome outcome{};
    for (std::int32_t attempt = 1; attempt <= attempts; ++attempt) {
        spdlog::info("Base install attempt {}/{}", attempt, attempts);
        outcome = m_runner.base_install(m_profile, m_profile.mountpoint, progress);
        if (outcome.success || outcome.cause != FailureCause::NetworkUnavailable) {
            break;
        }
        if (attempt < attempts) {
            spdlog::warn("Network unavailable ({}), retrying in {}ms", outcome.detail, m_retry_delay.count());
            std::this_thread::sleep_for(m_retry_delay);
        }
    }

    m_base_install_running = false;
    return outcome;
}

auto ProvisioningPipeline::run_stage(InstallationSession& session, Stage stage, const std::function<StageOutcome()>& stage_func) noexcept -> bool {
    spdlog::info("Stage {} started (state {})", stage_to_string(stage), pipeline_state_to_string(session.state));
    auto outcome = stage_func();
    if (!outcome.success) {
        spdlog::error("Stage {} failed: {} ({})", stage_to_string(stage), failure_cause_to_string(outcome.cause), outcome.detail);
        session.failure = StageFailure{.stage = stage, .cause = outcome.cause, .detail = std::move(outcome.detail)};
        session.state   = PipelineState::Failed;
        return false;
    }

    session.completed.push_back(stage);
    session.state = state_after(stage);
    spdlog::info("Stage {} finished, state is now {}", stage_to_string(stage), pipeline_state_to_string(session.state));
    return true;
}

void ProvisioningPipeline::run_cleanup(InstallationSession& session) noexcept {
    // nested mounts go first
    std::vector<std::string> unmount_order{session.mounted.rbegin(), session.mounted.rend()};
    spdlog::info("Cleanup: unmounting {} mountpoint(s)", unmount_order.size());

    auto outcome = m_runner.cleanup(unmount_order);
    if (!outcome.success) {
        spdlog::error("Cleanup failed: {} ({})", failure_cause_to_string(outcome.cause), outcome.detail);
        // the first failure is what the operator needs to see
        if (!session.failure.has_value()) {
            session.failure = StageFailure{.stage = Stage::Cleanup, .cause = outcome.cause, .detail = std::move(outcome.detail)};
            session.state   = PipelineState::Failed;
        }
        return;
    }

    session.mounted.clear();
    if (!session.failure.has_value()) {
        session.completed.push_back(Stage::Cleanup);
        session.state = PipelineState::Cleaned;
    }
}

}  // namespace installer
