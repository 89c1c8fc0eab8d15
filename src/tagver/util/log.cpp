#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace tagver;

namespace {

spdlog::level::level_enum to_spdlog_level(log::level l) noexcept {
    switch (l) {
    case log::level::trace:
        return spdlog::level::trace;
    case log::level::debug:
        return spdlog::level::debug;
    case log::level::info:
        return spdlog::level::info;
    case log::level::warn:
        return spdlog::level::warn;
    case log::level::error:
        return spdlog::level::err;
    case log::level::critical:
        return spdlog::level::critical;
    case log::level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Invalid log level", int(l));
}

}  // namespace

void tagver::log::init_logger() noexcept {
    // Standard output is reserved for the resolved versions
    auto logger = spdlog::stderr_color_mt("tagver");
    logger->set_pattern("[%^%-5l%$] %v");
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(std::move(logger));
}

void tagver::log::log_print(log::level l, std::string_view msg) noexcept {
    // Filtering is done by current_log_level, not by spdlog
    spdlog::default_logger_raw()->log(to_spdlog_level(l), "{}", msg);
}
