#ifndef AUTOINST_FSTAB_HPP
#define AUTOINST_FSTAB_HPP

#include <string_view>  // for string_view

namespace autoinst::fs {

// Runs genfstab on root mountpoint, writing {root_mountpoint}/etc/fstab
auto run_genfstab_on_mount(std::string_view root_mountpoint) noexcept -> bool;

}  // namespace autoinst::fs

#endif  // AUTOINST_FSTAB_HPP
