#include "autoinst/fetch_file.hpp"

#include <cstdint>  // for int32_t

#include <cpr/api.h>
#include <cpr/response.h>
#include <cpr/status_codes.h>
#include <cpr/timeout.h>

#include <spdlog/spdlog.h>

namespace autoinst::fetch {

auto is_url_reachable(std::string_view url, std::chrono::seconds timeout) noexcept -> bool {
    auto response    = cpr::Head(cpr::Url{url}, cpr::Timeout{timeout});
    auto status_code = static_cast<std::int32_t>(response.status_code);

    if (cpr::status::is_success(status_code)) {
        return true;
    }
    if (response.error) {
        spdlog::warn("'{}' is not reachable: {}", url, response.error.message);
    } else {
        spdlog::warn("'{}' answered with status {}", url, status_code);
    }
    return false;
}

}  // namespace autoinst::fetch
