#ifndef CONFIRMATION_GATE_HPP
#define CONFIRMATION_GATE_HPP

#include "block_device.hpp"
#include "partition_planner.hpp"

#include <iosfwd>       // for istream
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

#include <ftxui/dom/elements.hpp>  // for Element

namespace installer {

/// Asks the operator a yes/no question.
class Confirmer {
 public:
    virtual ~Confirmer() = default;

    /// @return true only on explicit affirmative answer.
    virtual auto confirm(std::string_view prompt) noexcept -> bool = 0;
};

/// Reads the answer from a line of input (stdin by default).
/// End of input counts as "no".
class ConsoleConfirmer final : public Confirmer {
 public:
    ConsoleConfirmer() noexcept;
    explicit ConsoleConfirmer(std::istream& input) noexcept;

    auto confirm(std::string_view prompt) noexcept -> bool override;

 private:
    std::istream& m_input;
};

/// Only "y" and "yes" are affirmative, in any case, surrounding whitespace ignored.
[[nodiscard]] auto is_affirmative(std::string_view answer) noexcept -> bool;

/// Proof that the operator agreed to erase a device.
/// Nothing but ConfirmationGate can make one.
class Consent final {
 public:
    [[nodiscard]] auto device() const noexcept -> const std::string& { return m_device; }

 private:
    friend class ConfirmationGate;
    explicit Consent(std::string device) noexcept;

    std::string m_device;
};

class ConfirmationGate final {
 public:
    explicit ConfirmationGate(Confirmer& confirmer) noexcept : m_confirmer(confirmer) { }

    /// Shows target and plan, then asks for consent.
    /// The question is asked at most once per gate, later calls are refused.
    /// @return std::nullopt if the operator declined.
    auto request_consent(const BlockDevice& device, const PartitionPlan& plan) noexcept -> std::optional<Consent>;

    [[nodiscard]] auto was_presented() const noexcept -> bool { return m_presented; }

 private:
    Confirmer& m_confirmer;
    bool m_presented{};
};

/// Table with target device and every planned partition.
[[nodiscard]] auto render_plan_summary(const BlockDevice& device, const PartitionPlan& plan) noexcept -> ftxui::Element;
[[nodiscard]] auto plan_summary_to_string(const BlockDevice& device, const PartitionPlan& plan) noexcept -> std::string;

}  // namespace installer

#endif  // CONFIRMATION_GATE_HPP
