#include "doctest_compatibility.h"

#include "autoinst/logger.hpp"

#include <memory>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

TEST_CASE("logger test")
{
    SECTION("errors are flushed right away")
    {
        auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
        REQUIRE(logger->flush_level() == spdlog::level::off);

        autoinst::logger::set_logger(logger);
        REQUIRE(spdlog::default_logger() == logger);
        REQUIRE(logger->flush_level() == spdlog::level::err);
    }
    SECTION("null logger keeps the previous one")
    {
        auto logger = std::make_shared<spdlog::logger>("kept", std::make_shared<spdlog::sinks::null_sink_mt>());
        autoinst::logger::set_logger(logger);
        autoinst::logger::set_logger(nullptr);
        REQUIRE(spdlog::default_logger() == logger);
    }
}
