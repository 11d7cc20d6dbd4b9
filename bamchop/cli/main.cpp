#include "bamchop_version.h"
#include "cli/cli.h"
#include "utils/log_utils.h"
#include "utils/string_utils.h"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    // Load logging settings from environment/command-line.
    spdlog::cfg::load_env_levels();
    bamchop::utils::InitLogging();

    const std::vector<std::string> arguments(argv + 1, argv + argc);
    if (arguments.size() == 1 && arguments[0] == "--version") {
        std::cout << BAMCHOP_VERSION << '\n';
        return EXIT_SUCCESS;
    }

    // Log cmd
    spdlog::debug("Running: \"{}\"", bamchop::utils::join(arguments, "\" \""));

    return bamchop::chop(argc, argv);
}
