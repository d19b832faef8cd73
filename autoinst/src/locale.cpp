#include "autoinst/locale.hpp"
#include "autoinst/file_utils.hpp"
#include "autoinst/io_utils.hpp"

#include <filesystem>  // for exists

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace autoinst::locale {

auto uncomment_locale_gen(std::string_view locale_gen_content, std::string_view locale) noexcept -> std::optional<std::string> {
    std::string result{};
    result.reserve(locale_gen_content.size());

    bool found{false};
    while (!locale_gen_content.empty()) {
        const auto line_end = locale_gen_content.find('\n');
        auto line           = locale_gen_content.substr(0, line_end);
        locale_gen_content.remove_prefix(line_end == std::string_view::npos ? locale_gen_content.size() : line_end + 1);

        // e.g format: #en_US.UTF-8 UTF-8
        auto entry = line;
        if (entry.starts_with('#')) {
            entry.remove_prefix(1);
        }
        if (entry.starts_with(locale) && entry.size() > locale.size() && entry[locale.size()] == ' ') {
            line  = entry;
            found = true;
        }
        result += line;
        if (line_end != std::string_view::npos) {
            result += '\n';
        }
    }

    if (!found) {
        return std::nullopt;
    }
    return std::make_optional<std::string>(std::move(result));
}

auto prepare_locale_set(std::string_view locale, std::string_view mountpoint) noexcept -> bool {
    const auto& locale_config_path = fmt::format(FMT_COMPILE("{}/etc/locale.conf"), mountpoint);
    const auto& locale_gen_path    = fmt::format(FMT_COMPILE("{}/etc/locale.gen"), mountpoint);

    if (!std::filesystem::exists(locale_gen_path)) {
        spdlog::error("locale.gen doesn't exist at {}", locale_gen_path);
        return false;
    }

    static constexpr auto LOCALE_CONFIG_PART = R"(LANG="{0}"
LC_MESSAGES="{0}"
)";

    {
        const auto& locale_config_text = fmt::format(LOCALE_CONFIG_PART, locale);
        if (!file_utils::create_file_for_overwrite(locale_config_path, locale_config_text)) {
            spdlog::error("Failed to open locale config for writing {}", locale_config_path);
            return false;
        }
    }

    const auto& locale_gen_content = file_utils::read_whole_file(locale_gen_path);
    auto&& new_locale_gen          = locale::uncomment_locale_gen(locale_gen_content, locale);
    if (!new_locale_gen) {
        spdlog::error("Locale '{}' is not listed in {}", locale, locale_gen_path);
        return false;
    }
    if (*new_locale_gen != locale_gen_content && !file_utils::create_file_for_overwrite(locale_gen_path, *new_locale_gen)) {
        spdlog::error("Failed to open locale gen for writing {}", locale_gen_path);
        return false;
    }
    return true;
}

auto set_locale(std::string_view locale, std::string_view mountpoint) noexcept -> bool {
    if (!locale::prepare_locale_set(locale, mountpoint)) {
        spdlog::error("Failed to prepare locale set");
        return false;
    }

    // Generate locales
    if (!utils::arch_chroot_checked("locale-gen"sv, mountpoint)) {
        spdlog::error("Failed to run locale-gen with locale '{}'", locale);
        return false;
    }
    return true;
}

auto set_keymap(std::string_view keymap, std::string_view mountpoint) noexcept -> bool {
    const auto& vconsole_config_path = fmt::format(FMT_COMPILE("{}/etc/vconsole.conf"), mountpoint);
    const auto& vconsole_config_text = fmt::format(FMT_COMPILE("KEYMAP={}\n"), keymap);
    if (!file_utils::create_file_for_overwrite(vconsole_config_path, vconsole_config_text)) {
        spdlog::error("Failed to open vconsole config for writing {}", vconsole_config_path);
        return false;
    }
    return true;
}

}  // namespace autoinst::locale
