#define CATCH_CONFIG_RUNNER 1

#include <semver/util/log.hpp>

#include <catch2/catch.hpp>
#include <magic_enum.hpp>

#include <cstdlib>

int main(int argc, char** argv) {
    semver::log::init_logger();
    // Set SEMVER_LOG_LEVEL=trace to see why versions are rejected
    if (auto ll = std::getenv("SEMVER_LOG_LEVEL")) {
        auto llo = magic_enum::enum_cast<semver::log::level>(ll);
        if (llo.has_value()) {
            semver::log::current_log_level = *llo;
        }
    }
    return Catch::Session().run(argc, argv);
}
