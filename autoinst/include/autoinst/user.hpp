#ifndef AUTOINST_USER_HPP
#define AUTOINST_USER_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoinst::user {

struct UserInfo final {
    std::string_view username;
    // crypt(3) hash, applied verbatim
    std::string_view password_hash;
    std::string_view shell;
    // empty if the user shouldn't get sudo rights
    std::string_view sudoers_group;
};

// Checks if colon separated database content (passwd/group) has entry with name
auto has_db_entry(std::string_view db_content, std::string_view name) noexcept -> bool;

// Checks if user exists in {mountpoint}/etc/passwd
auto user_exists(std::string_view username, std::string_view mountpoint) noexcept -> bool;

// Checks if group exists in {mountpoint}/etc/group
auto group_exists(std::string_view group, std::string_view mountpoint) noexcept -> bool;

// Create group on the system, does nothing if it already exists
auto create_group(std::string_view group, std::string_view mountpoint, bool is_system = false) noexcept -> bool;

// Set user password hash on the system
auto set_user_password_hash(std::string_view username, std::string_view password_hash, std::string_view mountpoint) noexcept -> bool;

// Create user on the system, existing users only get groups, password and sudoers updated
auto create_new_user(const user::UserInfo& user_info, const std::vector<std::string>& default_groups, std::string_view mountpoint) noexcept -> bool;

// Set system hostname
auto set_hostname(std::string_view hostname, std::string_view mountpoint) noexcept -> bool;

// Set system hosts
auto set_hosts(std::string_view hostname, std::string_view mountpoint) noexcept -> bool;

// Set password hash for root user
auto set_root_password_hash(std::string_view password_hash, std::string_view mountpoint) noexcept -> bool;

}  // namespace autoinst::user

#endif  // AUTOINST_USER_HPP
