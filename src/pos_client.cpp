#include "pos_client.hpp"
#include "mapping.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace stock_sync {

PosClient::PosClient(HttpTransport& transport, const Config& config)
    : mTransport(transport)
    , mConfig(config) {}

std::optional<PosSnapshot> PosClient::fetchInventory() {
    std::cerr << "[Pos] Fetching all inventory from POS...\n";

    HttpRequest req;
    req.method    = HttpRequest::Method::Get;
    req.url       = mConfig.posExportUrl();
    req.timeoutMs = mConfig.posTimeoutMs;

    HttpResponse resp;
    try {
        resp = mTransport.send(req);
    } catch (const std::exception& e) {
        std::cerr << "[Pos] Error fetching inventory: " << e.what() << "\n";
        return std::nullopt;
    }

    if (!resp.ok()) {
        std::cerr << "[Pos] Error fetching inventory: HTTP "
                  << resp.httpStatus << "\n";
        return std::nullopt;
    }

    PosSnapshot snapshot;
    try {
        snapshot = parsePosInventory(nlohmann::json::parse(resp.body));
    } catch (const std::exception& e) {
        std::cerr << "[Pos] Could not parse POS export: " << e.what() << "\n";
        return std::nullopt;
    }

    if (snapshot.skippedRecords > 0) {
        std::cerr << "[Pos] Skipped " << snapshot.skippedRecords
                  << " malformed record(s)\n";
    }
    for (const auto& sku : snapshot.duplicateSkus) {
        std::cerr << "[Pos] Duplicate SKU " << sku
                  << ": keeping the last record\n";
    }

    std::cerr << "[Pos] Loaded " << snapshot.items.size() << " items\n";
    return snapshot;
}

} // namespace stock_sync
