#include "tradewire/replay.hpp"
#include <iostream>
#include <filesystem>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    tradewire::ReplayConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--catalogue") {
            if (i + 1 < argc) {
                config.catalogue = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " needs a file" << std::endl;
                return 1;
            }
        } else if (arg == "-t" || arg == "--type") {
            if (i + 1 < argc) {
                config.types.push_back(argv[++i]);
            } else {
                std::cerr << "Error: " << arg << " needs a message type" << std::endl;
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: tradewire-replay [options] <script.yaml>\n"
                      << "Options:\n"
                      << "  -c, --catalogue <file>  Message catalogue (default: built-in)\n"
                      << "  -t, --type <name>       Only print this message type (repeatable)\n"
                      << "  -v, --verbose           Debug logging\n"
                      << "  -h, --help              Show this help\n"
                      << "\nExamples:\n"
                      << "  tradewire-replay session.yaml\n"
                      << "  tradewire-replay -t tickPrice -t error session.yaml\n";
            return 0;
        } else if (config.script.empty()) {
            config.script = arg;
        } else {
            std::cerr << "Error: unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (config.script.empty()) {
        std::cerr << "Error: no replay script given (see --help)" << std::endl;
        return 1;
    }

    if (!std::filesystem::exists(config.script)) {
        std::cerr << "Error: script not found: " << config.script << std::endl;
        return 1;
    }

    auto stats_res = tradewire::run_replay(config, std::cout);
    if (!stats_res) {
        std::cerr << "Replay failed: " << tradewire::error_msg(stats_res) << std::endl;
        return 1;
    }

    return 0;
}
