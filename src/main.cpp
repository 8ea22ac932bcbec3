#include "config.hpp"
#include "http_client.hpp"
#include "pos_client.hpp"
#include "reconciler.hpp"
#include "report.hpp"
#include "storefront_client.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace stock_sync;

static Config loadConfig(const CliArgs& cli) {
    std::map<std::string, std::string> envFile;
    if (auto values = readEnvFile(cli.envFile)) {
        envFile = std::move(*values);
    } else if (cli.envFileGiven) {
        throw ConfigError("Cannot read env file: " + cli.envFile);
    }
    return buildConfig(cli, processEnvironment, envFile);
}

int main(int argc, char* argv[]) {
    try {
        const CliArgs cli = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
        if (cli.showHelp) {
            std::cout << usage();
            return 0;
        }

        const Config cfg = loadConfig(cli);

        std::cout
            << "=== stock_sync ===\n"
            << "Store:       " << cfg.adminApiBase()      << "\n"
            << "Location:    " << cfg.locationId          << "\n"
            << "Page limit:  " << cfg.pageLimit           << "\n"
            << "Spacing:     " << cfg.itemSpacingMs << " ms/item, "
                               << cfg.mutationSpacingMs << " ms/mutation\n"
            << "Verbose:     " << (cfg.verbose ? "yes" : "no") << "\n"
            << "==================\n\n";

        HttpClient http(cfg.verbose);
        StorefrontClient storefront(http, cfg);
        PosClient pos(http, cfg);

        const auto items = storefront.fetchCatalog();
        if (!items) {
            std::cerr << "Could not retrieve SKUs from Shopify. Exiting.\n";
            return 1;
        }

        const auto inventory = pos.fetchInventory();
        if (!inventory) {
            std::cerr << "Could not retrieve inventory from POS. Exiting.\n";
            return 1;
        }
        if (inventory->items.empty()) {
            std::cerr << "[Pos] Warning: POS returned no usable items; "
                         "every SKU will be reported unmatched.\n";
        }

        Reconciler::Options options;
        options.itemSpacing     = std::chrono::milliseconds(cfg.itemSpacingMs);
        options.mutationSpacing = std::chrono::milliseconds(cfg.mutationSpacingMs);
        options.verbose         = cfg.verbose;
        Reconciler reconciler(storefront, options);

        const auto outcomes = reconciler.run(*items, *inventory);
        const auto summary  = summarize(outcomes);

        printReport(std::cout, outcomes, summary);
        const auto stats = storefront.getStats();
        std::cout << "Listing pages:       " << stats.totalPages     << "\n"
                  << "Products listed:     " << stats.totalProducts  << "\n"
                  << "Variants skipped:    " << stats.skippedVariants << "\n"
                  << "Mutations sent:      " << stats.totalMutations << "\n"
                  << "Pacing (s):          " << std::fixed << std::setprecision(2)
                  << reconciler.totalPacingSeconds() << "\n";

        return summary.hasFailures() ? 2 : 0;

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n" << usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
