#include <iostream>
#include <vector>
#include <string>
#include "cli/roxy_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::section("Roxy - port proxy");
    std::cout << theme::kv("roxy serve", "Restore all mappings and forward until interrupted");
    std::cout << theme::kv("roxy map", "<host> <protocol>  Allocate (or look up) a port");
    std::cout << theme::kv("roxy unmap", "<host> <protocol>  Delete a mapping");
    std::cout << theme::kv("roxy show", "List stored mappings");
    std::cout << theme::kv("roxy init", "Write a default roxy.yaml");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "  -c <file>       Config file (default ./roxy.yaml)\n"
              << "  --version       Show version\n"
              << "  --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args;
        std::string config_path = Config::default_config_path().string();

        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "-c" || a == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("Missing value for " + a);
                    return 1;
                }
                config_path = argv[++i];
            } else {
                args.push_back(a);
            }
        }

        if (args.empty() || args[0] == "--help" || args[0] == "-h") {
            print_usage();
            return 0;
        }

        const std::string& cmd = args[0];
        if (cmd == "--version") {
            std::cout << theme::bold("roxy") << theme::dim(std::string(" version ") + ROXY_VERSION) << "\n";
            return 0;
        }

        RoxyCLI cli(config_path);

        if (cmd == "serve") {
            return cli.run_serve();
        } else if (cmd == "init") {
            return cli.run_init();
        } else if (cmd == "show") {
            return cli.run_show();
        } else if (cmd == "map" || cmd == "unmap") {
            if (args.size() < 3) {
                std::cout << theme::fail("Missing arguments.");
                std::cout << theme::info("Usage: roxy " + cmd + " <host> <protocol>");
                return 1;
            }
            return cmd == "map" ? cli.run_map(args[1], args[2]) : cli.run_unmap(args[1], args[2]);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
