#ifndef AUTOINST_SYSTEMD_SERVICES_HPP
#define AUTOINST_SYSTEMD_SERVICES_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace autoinst::services {

// Full unit name, e.g NetworkManager -> NetworkManager.service
auto gen_unit_name(std::string_view service_name) noexcept -> std::string;

// Checks whether the unit is linked into any .wants/.requires directory of the system
auto is_service_enabled(std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool;

// Enables systemd service on the system, already enabled units are skipped
auto enable_systemd_service(std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool;

}  // namespace autoinst::services

#endif  // AUTOINST_SYSTEMD_SERVICES_HPP
