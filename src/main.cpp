#include "repository.hpp"
#include "shell.hpp"
#include "store.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

struct Config {
    std::string dataFile          = "inventory.json";
    int         lowStockThreshold = 5;
    bool        verbose           = false;
};

static void printUsage() {
    std::cout
        << "Usage: inventory_tracker [options]\n\n"
        << "Options:\n"
        << "  --data-file PATH   Inventory JSON file      "
           "(default: $INVENTORY_DATA_FILE or inventory.json)\n"
        << "  --low-stock N      Default low-stock threshold (default: 5)\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    if (const char* env = std::getenv("INVENTORY_DATA_FILE")) {
        if (*env != '\0') cfg.dataFile = env;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--data-file") && i + 1 < argc) {
            cfg.dataFile = argv[++i];
        } else if ((arg == "--low-stock") && i + 1 < argc) {
            cfg.lowStockThreshold = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.verbose) {
            std::cerr
                << "=== inventory_tracker ===\n"
                << "Data file:  " << cfg.dataFile          << "\n"
                << "Low stock:  " << cfg.lowStockThreshold << "\n"
                << "=========================\n";
        }

        inventory_tracker::JsonFileStore store(cfg.dataFile);
        store.setVerbose(cfg.verbose);

        auto loaded = store.load();

        inventory_tracker::InventoryRepository repo;
        if (loaded.status == inventory_tracker::StoreStatus::Ok) {
            try {
                repo.loadFrom(loaded.products);
            } catch (const std::invalid_argument& e) {
                std::cerr << "[Store] Warning: rejected data file "
                          << cfg.dataFile << ": " << e.what() << "\n";
                loaded.products.clear();
                loaded.status  = inventory_tracker::StoreStatus::Malformed;
                loaded.message = e.what();
            }
        }

        if (loaded.status == inventory_tracker::StoreStatus::Malformed ||
            loaded.status == inventory_tracker::StoreStatus::IoError) {
            std::cout << "Warning: could not load " << cfg.dataFile
                      << " (" << inventory_tracker::toString(loaded.status)
                      << "); starting with an empty inventory.\n";
            if (!store.protectUnreadable(loaded.status)) {
                std::cout << "Warning: changes in this session will NOT be "
                          << "saved to " << cfg.dataFile << ".\n";
            }
        }

        inventory_tracker::InventoryShell shell(repo, std::cin, std::cout,
                                                cfg.lowStockThreshold);
        shell.run();

        const auto status = store.save(repo.listAll());
        if (status == inventory_tracker::StoreStatus::Ok) {
            std::cout << "Saved " << repo.size() << " products to "
                      << cfg.dataFile << ".\n";
        } else {
            std::cout << "Error: inventory was NOT saved: "
                      << store.lastError() << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
