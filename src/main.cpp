#include <iostream>
#include <vector>
#include <string>
#include "cli/sftpflow_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sftpflow"
              << theme::color::RESET << theme::color::DIM
              << "                         Enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sftpflow run "
              << theme::color::RESET << theme::color::BROWN << "<node> [key=value...]"
              << theme::color::RESET << theme::color::DIM
              << "   Run one operation" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config PATH        Use another config file\n"
              << "    --version            Show version\n"
              << "    --help               Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path");
                    return 1;
                }
                config_path = argv[++i];
            } else {
                args.push_back(a);
            }
        }

        if (!args.empty() && args[0] == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "sftpflow"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (!args.empty() && args[0] == "--help") {
            print_usage();
            return 0;
        }

        SftpFlowCLI cli(config_path);
        if (args.empty()) {
            cli.run_repl();
            return 0;
        }
        if (args[0] == "run") {
            return cli.run_once(std::vector<std::string>(args.begin() + 1, args.end()));
        }

        std::cout << theme::fail("Unknown command: " + args[0]);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
