#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "confirmation_gate.hpp"
#include "install_profile.hpp"
#include "session.hpp"
#include "stage_runner.hpp"

#include <atomic>      // for atomic_bool
#include <chrono>      // for milliseconds
#include <functional>  // for function

namespace installer {

/// Drives the stages strictly in order: partition, format, mount, base install,
/// configure, bootloader. Halts on the first failure without rolling anything back.
/// Cleanup runs exactly once afterwards, whether the stages succeeded or not.
class ProvisioningPipeline final {
 public:
    ProvisioningPipeline(StageRunner& runner, const InstallProfile& profile, std::chrono::milliseconds retry_delay = std::chrono::seconds{5}) noexcept
      : m_runner(runner), m_profile(profile), m_retry_delay(retry_delay) { }

    /// Runs the whole installation. Can be called only once per pipeline.
    /// @param consent Operator approval for erasing session.device.
    /// @return true if every stage including cleanup succeeded,
    /// otherwise session.failure tells where and why it stopped.
    auto run(const Consent& consent, InstallationSession& session, const ProgressCallback& progress = {}) noexcept -> bool;

    /// Base install with retries on network failures.
    /// Refused while another base install is in progress.
    auto install_base_system(const ProgressCallback& progress) noexcept -> StageOutcome;

 private:
    auto run_stage(InstallationSession& session, Stage stage, const std::function<StageOutcome()>& stage_func) noexcept -> bool;
    void run_cleanup(InstallationSession& session) noexcept;

    StageRunner& m_runner;
    const InstallProfile& m_profile;
    std::chrono::milliseconds m_retry_delay;

    bool m_started{};
    std::atomic_bool m_base_install_running{};
};

}  // namespace installer

#endif  // PIPELINE_HPP
