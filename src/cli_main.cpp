#include <spdlog/spdlog.h>
#include <iostream>
#include "patchy/Cli.hpp"
#include "patchy/Errors.hpp"

using namespace patchy;

int main(int argc, char** argv) {
    try {
        CliOptions opts = parse_cli(argc, argv);
        if (opts.help) {
            std::cout << opts.help_text;
            return 0;
        }

        spdlog::set_level(parse_log_level(opts.log_level));
        return run_command(opts, std::cout);

    } catch (const PatchError& pe) {
        spdlog::error("{}", pe.what());
        return 1;
    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        return 1;
    }
}
