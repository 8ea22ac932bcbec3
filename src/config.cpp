#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace stock_sync {

namespace {

struct Setting {
    const char* flag;
    const char* variable;
    bool        required;
    const char* help;
};

const Setting kSettings[] = {
    {"--store",               "SHOPIFY_STORE",            true,
     "Shopify store domain, or base URL for a mock server"},
    {"--token",               "SHOPIFY_TOKEN",            true,
     "Admin API access token"},
    {"--location",            "LOCATION_ID",              true,
     "Inventory location id"},
    {"--pos-url",             "POS_BASE_URL",             true,
     "POS bulk export endpoint"},
    {"--pos-password",        "POS_PASSWORD",             true,
     "POS shared secret"},
    {"--api-version",         "SHOPIFY_API_VERSION",      false,
     "Admin API version            (default: 2024-07)"},
    {"--page-limit",          "SYNC_PAGE_LIMIT",          false,
     "Products per listing page    (default: 250, max 250)"},
    {"--mutation-timeout-ms", "SYNC_MUTATION_TIMEOUT_MS", false,
     "Timeout for stock/price calls (default: 15000)"},
    {"--listing-timeout-ms",  "SYNC_LISTING_TIMEOUT_MS",  false,
     "Timeout per listing page     (default: 30000)"},
    {"--pos-timeout-ms",      "SYNC_POS_TIMEOUT_MS",      false,
     "Timeout for the POS export   (default: 60000)"},
    {"--item-spacing-ms",     "SYNC_ITEM_SPACING_MS",     false,
     "Minimum gap between items    (default: 200)"},
    {"--mutation-spacing-ms", "SYNC_MUTATION_SPACING_MS", false,
     "Minimum gap between mutations (default: 200)"},
};

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

const Setting* findByFlag(const std::string& flag) {
    for (const auto& setting : kSettings) {
        if (flag == setting.flag) return &setting;
    }
    return nullptr;
}

int parseInt(const std::string& name, const std::string& text) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + name + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError("Invalid integer for " + name + ": '" + text + "'");
    }
    return value;
}

bool isDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// Config URLs
// ---------------------------------------------------------------------------

std::string Config::adminApiBase() const {
    std::string base = trimTrailingSlashes(storeDomain);
    if (base.find("://") == std::string::npos) {
        base = "https://" + base;
    }
    return base + "/admin/api/" + apiVersion;
}

std::string Config::productsUrl() const {
    return adminApiBase() + "/products.json?limit=" + std::to_string(pageLimit);
}

std::string Config::graphqlUrl() const {
    return adminApiBase() + "/graphql.json";
}

std::string Config::variantUrl(const std::string& variantId) const {
    return adminApiBase() + "/variants/" + variantId + ".json";
}

std::string Config::posExportUrl() const {
    const char sep = (posBaseUrl.find('?') == std::string::npos) ? '?' : '&';
    return posBaseUrl + sep + "ps=" + urlEncode(posPassword)
         + "&get=all&output=json&sep=;";
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

CliArgs parseArgs(const std::vector<std::string>& args) {
    CliArgs cli;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            cli.showHelp = true;
        } else if (arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "--env-file") {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for --env-file");
            }
            cli.envFile      = args[++i];
            cli.envFileGiven = true;
        } else if (const Setting* setting = findByFlag(arg)) {
            if (i + 1 >= args.size()) {
                throw ConfigError(std::string("Missing value for ") + setting->flag);
            }
            cli.values[setting->variable] = args[++i];
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }
    return cli;
}

// ---------------------------------------------------------------------------
// dotenv
// ---------------------------------------------------------------------------

std::map<std::string, std::string> parseEnvFile(const std::string& contents) {
    std::map<std::string, std::string> values;
    std::istringstream in(contents);
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq));
        std::string value     = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing " # comment".
            const auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }
        values[key] = value;
    }
    return values;
}

std::optional<std::map<std::string, std::string>>
readEnvFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parseEnvFile(contents.str());
}

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ---------------------------------------------------------------------------
// Merge + validate
// ---------------------------------------------------------------------------

Config buildConfig(const CliArgs& cli,
                   const EnvLookup& environment,
                   const std::map<std::string, std::string>& envFile) {
    auto lookup = [&](const std::string& name) -> std::string {
        auto fromCli = cli.values.find(name);
        if (fromCli != cli.values.end() && !fromCli->second.empty()) {
            return fromCli->second;
        }
        if (environment) {
            auto fromEnv = environment(name);
            if (fromEnv && !fromEnv->empty()) {
                return *fromEnv;
            }
        }
        auto fromFile = envFile.find(name);
        if (fromFile != envFile.end()) {
            return fromFile->second;
        }
        return "";
    };

    std::string missing;
    for (const auto& setting : kSettings) {
        if (setting.required && lookup(setting.variable).empty()) {
            if (!missing.empty()) missing += ", ";
            missing += setting.variable;
        }
    }
    if (!missing.empty()) {
        throw ConfigError("Missing required configuration: " + missing);
    }

    Config cfg;
    cfg.storeDomain = lookup("SHOPIFY_STORE");
    cfg.accessToken = lookup("SHOPIFY_TOKEN");
    cfg.locationId  = lookup("LOCATION_ID");
    cfg.posBaseUrl  = lookup("POS_BASE_URL");
    cfg.posPassword = lookup("POS_PASSWORD");
    cfg.verbose     = cli.verbose;

    auto optionalInt = [&](const char* name, int& target) {
        const std::string text = lookup(name);
        if (!text.empty()) target = parseInt(name, text);
    };

    const std::string apiVersion = lookup("SHOPIFY_API_VERSION");
    if (!apiVersion.empty()) cfg.apiVersion = apiVersion;
    optionalInt("SYNC_PAGE_LIMIT",          cfg.pageLimit);
    optionalInt("SYNC_MUTATION_TIMEOUT_MS", cfg.mutationTimeoutMs);
    optionalInt("SYNC_LISTING_TIMEOUT_MS",  cfg.listingTimeoutMs);
    optionalInt("SYNC_POS_TIMEOUT_MS",      cfg.posTimeoutMs);
    optionalInt("SYNC_ITEM_SPACING_MS",     cfg.itemSpacingMs);
    optionalInt("SYNC_MUTATION_SPACING_MS", cfg.mutationSpacingMs);

    // --- validation ---
    if (cfg.pageLimit < 1 || cfg.pageLimit > 250) {
        throw ConfigError("SYNC_PAGE_LIMIT must be between 1 and 250");
    }
    if (cfg.mutationTimeoutMs <= 0 || cfg.listingTimeoutMs <= 0 ||
        cfg.posTimeoutMs <= 0) {
        throw ConfigError("Timeouts must be positive");
    }
    if (cfg.itemSpacingMs < 0 || cfg.mutationSpacingMs < 0) {
        throw ConfigError("Spacing values must not be negative");
    }
    if (!isDigits(cfg.locationId) &&
        cfg.locationId.rfind("gid://shopify/Location/", 0) != 0) {
        throw ConfigError("LOCATION_ID must be numeric or a Location gid: '" +
                          cfg.locationId + "'");
    }
    try {
        parseUrl(cfg.adminApiBase());
        parseUrl(cfg.posBaseUrl);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

std::string usage() {
    std::ostringstream out;
    out << "Usage: stock_sync [options]\n\n"
        << "Sets Shopify stock and price from the POS catalog.\n"
        << "Each option falls back to the named environment variable, then to\n"
        << "the .env file.\n\n"
        << "Options:\n";
    for (const auto& setting : kSettings) {
        std::string left = std::string("  ") + setting.flag + " V";
        left.resize(26, ' ');
        out << left << setting.help << "  [" << setting.variable
            << (setting.required ? ", required" : "") << "]\n";
    }
    out << "  --env-file PATH         dotenv file           (default: .env)\n"
        << "  --verbose               Enable verbose diagnostics\n"
        << "  --help, -h              Show this message\n";
    return out.str();
}

} // namespace stock_sync
