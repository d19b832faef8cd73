#include "confirmation_gate.hpp"
#include "definitions.hpp"

// import autoinst
#include "autoinst/partition.hpp"
#include "autoinst/string_utils.hpp"
#include "autoinst/system_query.hpp"

#include <cstdio>    // for fflush, stdout
#include <iostream>  // for cin, istream
#include <utility>   // for move
#include <vector>    // for vector

#include <fmt/compile.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <ftxui/dom/node.hpp>      // for Render
#include <ftxui/dom/table.hpp>     // for Table
#include <ftxui/screen/screen.hpp>  // for Screen

using namespace std::string_view_literals;

namespace installer {

ConsoleConfirmer::ConsoleConfirmer() noexcept : m_input(std::cin) { }
ConsoleConfirmer::ConsoleConfirmer(std::istream& input) noexcept : m_input(input) { }

auto ConsoleConfirmer::confirm(std::string_view prompt) noexcept -> bool {
    output_inter("{}", prompt);
    std::fflush(stdout);

    std::string answer{};
    if (!std::getline(m_input, answer)) {
        output_inter("\n");
        spdlog::warn("No answer, input closed");
        return false;
    }
    spdlog::debug("Operator answered '{}'", answer);
    return is_affirmative(answer);
}

auto is_affirmative(std::string_view answer) noexcept -> bool {
    const auto& normalized = autoinst::utils::to_lower(autoinst::utils::trim(answer));
    return normalized == "y"sv || normalized == "yes"sv;
}

Consent::Consent(std::string device) noexcept : m_device(std::move(device)) { }

auto ConfirmationGate::request_consent(const BlockDevice& device, const PartitionPlan& plan) noexcept -> std::optional<Consent> {
    if (m_presented) {
        spdlog::error("Confirmation was already requested during this run");
        return std::nullopt;
    }
    m_presented = true;

    const auto& prompt = fmt::format(FMT_COMPILE("{}\nALL DATA ON {} WILL BE ERASED. Continue? [y/N] "),
        plan_summary_to_string(device, plan), device.path);
    if (!m_confirmer.confirm(prompt)) {
        spdlog::info("Installation onto {} declined", device.path);
        return std::nullopt;
    }
    spdlog::info("Installation onto {} confirmed", device.path);
    return Consent{device.path};
}

auto render_plan_summary(const BlockDevice& device, const PartitionPlan& plan) noexcept -> ftxui::Element {
    using namespace ftxui;

    std::vector<std::vector<std::string>> rows{{"Partition", "Role", "Size", "Filesystem", "Mountpoint"}};
    for (const auto& part : plan.partitions) {
        rows.push_back({
            part.device,
            std::string{partition_role_to_string(part.role)},
            autoinst::disk::format_size(part.size),
            std::string{autoinst::fs::filesystem_type_to_string(part.fstype)},
            part.mountpoint,
        });
    }

    auto table = Table(std::move(rows));
    table.SelectAll().Border(LIGHT);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectRow(0).Border(DOUBLE);

    const auto& target_line = fmt::format(FMT_COMPILE("Target: {} ({}, {}, {})"), device.path,
        device.model.empty() ? "unknown model"sv : std::string_view{device.model},
        transport_class_to_string(device.transport_class), autoinst::disk::format_size(device.capacity));
    return vbox({
        text(target_line) | bold,
        table.Render(),
    });
}

auto plan_summary_to_string(const BlockDevice& device, const PartitionPlan& plan) noexcept -> std::string {
    auto document = render_plan_summary(device, plan);
    auto screen   = ftxui::Screen::Create(ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    return screen.ToString();
}

}  // namespace installer
