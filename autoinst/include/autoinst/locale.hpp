#ifndef AUTOINST_LOCALE_HPP
#define AUTOINST_LOCALE_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::locale {

// Uncomments locale entry in locale.gen content.
// Returns std::nullopt if the locale isn't listed at all
auto uncomment_locale_gen(std::string_view locale_gen_content, std::string_view locale) noexcept -> std::optional<std::string>;

// Set system language
auto set_locale(std::string_view locale, std::string_view mountpoint) noexcept -> bool;

// Prepare system language.
// Sets without updating system locale
auto prepare_locale_set(std::string_view locale, std::string_view mountpoint) noexcept -> bool;

// Set virtual console keymap
auto set_keymap(std::string_view keymap, std::string_view mountpoint) noexcept -> bool;

}  // namespace autoinst::locale

#endif  // AUTOINST_LOCALE_HPP
