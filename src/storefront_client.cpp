#include "storefront_client.hpp"
#include "mapping.hpp"
#include "queries.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace stock_sync {

namespace {

bool isDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

/// "HTTP 422: price must be ..." when the body explains the failure.
std::string describeHttpFailure(const HttpResponse& resp) {
    std::string message = "HTTP " + std::to_string(resp.httpStatus);

    const auto body = nlohmann::json::parse(resp.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("errors")) {
        return message;
    }

    const auto& errors = body["errors"];
    if (errors.is_object()) {
        return message + ": " + errors.dump();
    }
    const auto messages = extractGraphqlErrors(body);
    if (!messages.empty()) {
        message += ": " + messages.front();
    }
    return message;
}

} // namespace

StorefrontClient::StorefrontClient(HttpTransport& transport, const Config& config)
    : mTransport(transport)
    , mConfig(config) {}

HttpRequest StorefrontClient::makeRequest(HttpRequest::Method method,
                                          const std::string& url,
                                          std::string body,
                                          int timeoutMs) const {
    HttpRequest req;
    req.method    = method;
    req.url       = url;
    req.body      = std::move(body);
    req.timeoutMs = timeoutMs;
    req.headers.emplace_back("X-Shopify-Access-Token", mConfig.accessToken);
    return req;
}

// ---------------------------------------------------------------------------
// Listing
// ---------------------------------------------------------------------------

std::optional<std::vector<StorefrontItem>> StorefrontClient::fetchCatalog() {
    std::vector<StorefrontItem> allItems;
    std::set<std::string>       visited;
    std::optional<std::string>  url = mConfig.productsUrl();

    while (url) {
        if (!visited.insert(*url).second) {
            std::cerr << "[Storefront] Pagination loop detected at page "
                      << (mStats.totalPages + 1) << "; aborting listing.\n";
            return std::nullopt;
        }

        if (mConfig.verbose) {
            std::cerr << "[Storefront] Fetching page " << (mStats.totalPages + 1)
                      << "\n";
        }

        HttpResponse resp;
        try {
            resp = mTransport.send(makeRequest(HttpRequest::Method::Get, *url, "",
                                               mConfig.listingTimeoutMs));
        } catch (const std::exception& e) {
            std::cerr << "[Storefront] Error fetching products: " << e.what() << "\n";
            return std::nullopt;
        }

        if (!resp.ok()) {
            std::cerr << "[Storefront] Error fetching products: "
                      << describeHttpFailure(resp) << "\n";
            return std::nullopt;
        }

        ProductsPage page;
        try {
            page = parseProductsPage(nlohmann::json::parse(resp.body));
        } catch (const std::exception& e) {
            std::cerr << "[Storefront] Failed to parse products page: "
                      << e.what() << "\n";
            return std::nullopt;
        }

        ++mStats.totalPages;
        mStats.totalProducts   += page.productCount;
        mStats.skippedVariants += page.skippedVariants;

        allItems.insert(allItems.end(),
                        std::make_move_iterator(page.items.begin()),
                        std::make_move_iterator(page.items.end()));

        if (mConfig.verbose) {
            std::cerr << "[Storefront] Got " << page.items.size()
                      << " variants from " << page.productCount
                      << " products (total so far: " << allItems.size() << ")\n";
        }

        url = parseNextPageUrl(resp.link);
    }

    std::cerr << "[Storefront] Retrieved " << allItems.size() << " SKUs in "
              << mStats.totalPages << " page(s)\n";
    return allItems;
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

MutationResult StorefrontClient::setOnHandQuantity(const StorefrontItem& item,
                                                   long long quantity) {
    static const std::string kField = "inventorySetOnHandQuantities";

    nlohmann::json variables = {
        {"input", {
            {"reason", queries::kQuantityChangeReason},
            {"setQuantities", nlohmann::json::array({
                {
                    {"inventoryItemId", toGid("InventoryItem", item.inventoryItemId)},
                    {"locationId",      toGid("Location", mConfig.locationId)},
                    {"quantity",        quantity}
                }
            })}
        }}
    };

    nlohmann::json payload;
    payload["query"]     = queries::kSetOnHandQuantitiesMutation;
    payload["variables"] = variables;

    MutationResult result;
    ++mStats.totalMutations;

    try {
        const auto resp = mTransport.send(makeRequest(HttpRequest::Method::Post,
                                                      mConfig.graphqlUrl(),
                                                      payload.dump(),
                                                      mConfig.mutationTimeoutMs));
        if (!resp.ok()) {
            result.message = describeHttpFailure(resp);
            return result;
        }

        const auto body = nlohmann::json::parse(resp.body);

        const auto errors = extractGraphqlErrors(body);
        if (!errors.empty()) {
            result.message = errors.front();
            return result;
        }

        const auto userErrors = extractUserErrors(body, kField);
        if (!userErrors.empty()) {
            result.message = userErrors.front();
            return result;
        }

        result.ok = true;
    } catch (const std::exception& e) {
        result.message = e.what();
    }
    return result;
}

MutationResult StorefrontClient::updatePrice(const StorefrontItem& item,
                                             int64_t newPrice) {
    MutationResult result;

    if (item.variantId.empty()) {
        result.message = "variant has no id";
        return result;
    }

    ++mStats.totalMutations;

    try {
        nlohmann::json variant;
        if (isDigits(item.variantId)) {
            variant["id"] = std::stoll(item.variantId);
        } else {
            variant["id"] = item.variantId;
        }
        variant["price"] = std::to_string(newPrice);
        const nlohmann::json payload = {{"variant", variant}};

        const auto resp = mTransport.send(makeRequest(HttpRequest::Method::Put,
                                                      mConfig.variantUrl(item.variantId),
                                                      payload.dump(),
                                                      mConfig.mutationTimeoutMs));
        if (!resp.ok()) {
            result.message = describeHttpFailure(resp);
            return result;
        }
        result.ok = true;
    } catch (const std::exception& e) {
        result.message = e.what();
    }
    return result;
}

} // namespace stock_sync
