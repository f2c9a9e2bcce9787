// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <iostream>

using namespace surge::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    configure_logging(args);

    auto config = resolve_config(args);
    if (!config) {
        std::cerr << "Error: invalid configuration: " << config.error().message() << std::endl;
        return 1;
    }

    try {
        CliResult result = 0;
        if (args.list) {
            result = list(*config);
        } else if (args.prune) {
            result = prune(*config);
        } else if (!args.urls.empty() || args.resume_all) {
            result = download(args, *config);
        } else {
            std::cerr << "Error: No URL specified" << std::endl;
            std::cout << "Use -h for help" << std::endl;
            return 1;
        }
        return result ? *result : 1;
    } catch (const std::exception& e) {
        spdlog::critical("fatal: {}", e.what());
        return 1;
    }
}
