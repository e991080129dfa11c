#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: cmdb-scheduler <command> [--config PATH] [options]\n\n"
              << "Commands:\n"
              << "  serve                       Run the scheduler until SIGINT/SIGTERM\n"
              << "  next [--expression E] [-n N]\n"
              << "                              Print the next activations of a schedule\n"
              << "  machines add|list|remove    Manage machine records\n\n"
              << "The default config is ~/.cmdb/config.json.\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::string config_path = cmdb::default_config_path();
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(a);
        }
    }

    if (cmd == "serve") {
        return cmdb::cmd_serve(config_path);
    }
    else if (cmd == "next") {
        std::string expression;
        int count = 5;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "--expression" || args[i] == "-e") && i + 1 < args.size()) {
                expression = args[++i];
            } else if (args[i] == "-n" && i + 1 < args.size()) {
                try {
                    count = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid count: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return cmdb::cmd_next(config_path, expression, count);
    }
    else if (cmd == "machines") {
        return cmdb::cmd_machines(config_path, args);
    }
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
