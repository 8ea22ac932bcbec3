#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "models.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stock_sync {

/// Shopify Admin API access: paginated product listing plus the two
/// mutations the reconciler needs.
class StorefrontClient {
public:
    struct Stats {
        int totalPages      = 0;
        int totalProducts   = 0;
        int skippedVariants = 0;
        int totalMutations  = 0;
    };

    StorefrontClient(HttpTransport& transport, const Config& config);

    /// Walk products.json following the Link header until exhausted.
    /// Returns std::nullopt if any page fails: a partial catalog is never
    /// returned.
    std::optional<std::vector<StorefrontItem>> fetchCatalog();

    /// Set the absolute on-hand quantity at the configured location.
    MutationResult setOnHandQuantity(const StorefrontItem& item,
                                     long long quantity);

    /// Set the variant price to @p newPrice whole currency units.
    MutationResult updatePrice(const StorefrontItem& item, int64_t newPrice);

    Stats getStats() const { return mStats; }

private:
    HttpTransport& mTransport;
    const Config&  mConfig;
    Stats          mStats{};

    HttpRequest makeRequest(HttpRequest::Method method,
                            const std::string& url,
                            std::string body,
                            int timeoutMs) const;
};

} // namespace stock_sync
