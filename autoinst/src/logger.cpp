#include "autoinst/logger.hpp"

#include <utility>  // for move

namespace autoinst::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    if (!default_logger) {
        return;
    }
    // the process may exit right after an error, don't lose it in the buffer
    default_logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(std::move(default_logger));
}

}  // namespace autoinst::logger
