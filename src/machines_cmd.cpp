#include "commands.hpp"
#include "config.hpp"
#include "storage.hpp"
#include <iostream>

namespace cmdb {

int cmd_machines(const std::string& config_path, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: cmdb-scheduler machines <add|list|remove> [options]\n";
        return 1;
    }

    StoragePtr storage;
    try {
        Config cfg = Config::load(config_path);
        storage = make_storage(cfg.database);
    } catch (const std::exception& e) {
        std::cerr << "[machines] " << e.what() << "\n";
        return 1;
    }

    std::string subcmd = args[0];
    int code = 0;
    try {
        if (subcmd == "add") {
            Machine m;
            for (size_t i = 1; i < args.size(); i++) {
                if (args[i] == "--name" && i + 1 < args.size()) {
                    m.name = args[++i];
                } else if (args[i] == "--hostname" && i + 1 < args.size()) {
                    m.hostname = args[++i];
                } else if (args[i] == "--zone" && i + 1 < args.size()) {
                    m.zone = args[++i];
                } else if (args[i] == "--os" && i + 1 < args.size()) {
                    m.os = args[++i];
                } else if (args[i] == "--address" && i + 1 < args.size()) {
                    m.addresses.push_back(args[++i]);
                }
            }
            if (m.name.empty()) {
                std::cerr << "Usage: cmdb-scheduler machines add --name N [--hostname H] [--zone Z] "
                             "[--os OS] [--address A]...\n";
                code = 1;
            } else {
                if (m.hostname.empty()) m.hostname = m.name;
                storage->create(m);
                std::cout << "Added machine: guid=" << m.guid << " name=" << m.name << "\n";
            }
        }
        else if (subcmd == "list") {
            ObjectList<Machine> machines;
            storage->list(machines);
            if (machines.items.empty()) {
                std::cout << "No machines.\n";
            }
            for (auto& m : machines.items) {
                std::cout << "guid=" << m.guid << " name=" << m.name
                          << " hostname=" << m.hostname << " zone=" << m.zone;
                if (!m.addresses.empty()) {
                    std::cout << " addresses=";
                    for (size_t i = 0; i < m.addresses.size(); i++) {
                        std::cout << (i ? "," : "") << m.addresses[i];
                    }
                }
                std::cout << "\n";
            }
        }
        else if (subcmd == "remove") {
            if (args.size() < 2) {
                std::cerr << "Usage: cmdb-scheduler machines remove <name>\n";
                code = 1;
            } else {
                Machine m;
                m.name = args[1];
                storage->remove(m);
                std::cout << "Removed machine: " << m.name << "\n";
            }
        }
        else {
            std::cerr << "Unknown machines subcommand: " << subcmd << "\n";
            code = 1;
        }
    } catch (const StorageError& e) {
        std::cerr << "[machines] " << e.what() << "\n";
        code = 1;
    }

    storage->close();
    return code;
}

} // namespace cmdb
