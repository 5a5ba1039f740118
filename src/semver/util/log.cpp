#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/spdlog.h>

using namespace semver;

namespace {

spdlog::level::level_enum spdlog_level_of(log::level l, std::string_view msg) noexcept {
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
        break;
    }
    neo_assert_always(invariant, false, "No message may be logged at this level", msg, int(l));
}

}  // namespace

void semver::log::init_logger() noexcept { spdlog::set_pattern("[%^%-5l%$] [semver] %v"); }

void semver::log::log_print(semver::log::level l, std::string_view msg) noexcept {
    static auto logger_inst = [] {
        auto logger = spdlog::default_logger_raw();
        // Filtering is done by current_log_level before we get here
        logger->set_level(spdlog::level::trace);
        return logger;
    }();
    logger_inst->log(spdlog_level_of(l, msg), "{}", msg);
}
