#include "utils/log_utils.h"

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // global setup...
    bamchop::utils::InitLogging();
    spdlog::set_level(spdlog::level::off);

    int result = Catch::Session().run(argc, argv);

    return result;
}
