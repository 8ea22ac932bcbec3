#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stock_sync {

/// Missing or invalid configuration. Raised before any network activity.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Immutable run configuration, built once in main() and passed by
/// reference to the clients.
struct Config {
    std::string storeDomain;     // "shop.myshopify.com" or "http://localhost:4000"
    std::string accessToken;
    std::string locationId;      // numeric id or Location gid
    std::string posBaseUrl;
    std::string posPassword;

    std::string apiVersion        = "2024-07";
    int         pageLimit         = 250;
    int         mutationTimeoutMs = 15000;
    int         listingTimeoutMs  = 30000;
    int         posTimeoutMs      = 60000;
    int         itemSpacingMs     = 200;
    int         mutationSpacingMs = 200;
    bool        verbose           = false;

    /// "https://shop.myshopify.com/admin/api/2024-07"
    std::string adminApiBase() const;
    std::string productsUrl() const;
    std::string graphqlUrl() const;
    std::string variantUrl(const std::string& variantId) const;

    /// POS bulk export URL, password included as the "ps" query parameter.
    std::string posExportUrl() const;
};

/// Result of command-line parsing, before environment merging.
struct CliArgs {
    bool        showHelp = false;
    bool        verbose  = false;
    std::string envFile  = ".env";
    bool        envFileGiven = false;
    std::map<std::string, std::string> values;   // keyed by variable name
};

/// Looks a variable up in the process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Parse argv (without the program name).
/// @throws ConfigError on unknown options or missing option values.
CliArgs parseArgs(const std::vector<std::string>& args);

/// Parse dotenv text: KEY=VALUE lines, '#' comments, optional "export "
/// prefix, optional single or double quotes around the value.
std::map<std::string, std::string> parseEnvFile(const std::string& contents);

/// Read and parse a dotenv file; std::nullopt if it cannot be opened.
std::optional<std::map<std::string, std::string>>
readEnvFile(const std::string& path);

/// Merge CLI values, the process environment and the dotenv file (highest
/// precedence first) and validate the result.
/// @throws ConfigError naming every missing required variable, or the
///         first invalid value.
Config buildConfig(const CliArgs& cli,
                   const EnvLookup& environment,
                   const std::map<std::string, std::string>& envFile);

/// EnvLookup backed by std::getenv.
std::optional<std::string> processEnvironment(const std::string& name);

std::string usage();

} // namespace stock_sync
