#include "app.hpp"
#include "config.hpp"
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace BackupLens;

    auto usage = [&](int code) {
        std::cerr << App::usage(argv[0]);
        return code;
    };

    AppConfig config = AppConfig::fromEnvironment();

    // Parse options with getopt_long (allows options anywhere)
    static struct option long_options[] = {
        {"store",     required_argument, nullptr, 's'},
        {"store-dir", required_argument, nullptr, 'd'},
        {"db",        required_argument, nullptr, 'D'},
        {"log-dir",   required_argument, nullptr, 'l'},
        {"verbose",   no_argument,       nullptr, 'v'},
        {"help",      no_argument,       nullptr, 'h'},
        {nullptr,     0,                 nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "s:d:l:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 's': {
                auto backend = AppConfig::parseBackend(optarg);
                if (!backend) {
                    std::cerr << "Unknown store backend '" << optarg << "'\n";
                    return usage(kExitUsage);
                }
                config.storeBackend = *backend;
                break;
            }
            case 'd': config.storeDir = optarg; break;
            case 'D': config.databasePath = optarg; break;
            case 'l': config.logDir = optarg; break;
            case 'v': config.verbose = true; break;
            case 'h': return usage(kExitOk);
            default:  return usage(kExitUsage);
        }
    }

    // Remaining arguments after options
    if (argc - optind < 1) return usage(kExitUsage);

    std::string command = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    try {
        App app(config, std::cout);
        if (!app.init()) {
            std::cerr << "Failed to initialize application\n";
            return kExitFailure;
        }

        int code = app.run(command, args);
        app.shutdown();
        return code;
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        return usage(kExitUsage);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}
