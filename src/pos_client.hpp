#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "models.hpp"

#include <optional>

namespace stock_sync {

/// Point-of-sale bulk export. One unpaginated call returns the whole
/// catalog; individual malformed records are dropped, not fatal.
class PosClient {
public:
    PosClient(HttpTransport& transport, const Config& config);

    /// Returns std::nullopt on transport failure, a non-2xx status or a body
    /// that is not a JSON array.
    std::optional<PosSnapshot> fetchInventory();

private:
    HttpTransport& mTransport;
    const Config&  mConfig;
};

} // namespace stock_sync
