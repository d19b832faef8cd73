#ifndef AUTOINST_FETCH_FILE_HPP
#define AUTOINST_FETCH_FILE_HPP

#include <chrono>       // for seconds
#include <string_view>  // for string_view

namespace autoinst::fetch {

// Checks whether url answers a HEAD request with a success status
auto is_url_reachable(std::string_view url, std::chrono::seconds timeout = std::chrono::seconds{15}) noexcept -> bool;

}  // namespace autoinst::fetch

#endif  // AUTOINST_FETCH_FILE_HPP
