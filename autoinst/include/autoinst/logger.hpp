#ifndef AUTOINST_LOGGER_HPP
#define AUTOINST_LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace autoinst::logger {

// Set library default logger, errors are flushed immediately.
// Null logger is ignored
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

}  // namespace autoinst::logger

#endif  // AUTOINST_LOGGER_HPP
