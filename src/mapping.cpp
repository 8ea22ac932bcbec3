#include "mapping.hpp"
#include "normalize.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace stock_sync {

namespace {

/// Ids arrive as JSON numbers from REST and as strings from elsewhere.
std::string idToString(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<unsigned long long>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e15) {
            return std::to_string(static_cast<long long>(d));
        }
        return value.dump();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return "";
}

/// Decimal text as Shopify sent it; numbers are rendered, null gives "".
std::string priceText(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    return "";
}

std::optional<long long> parseQuantity(const nlohmann::json& value) {
    double d = 0.0;
    if (value.is_number_unsigned()) {
        const auto u = value.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(u);
    } else if (value.is_number_integer()) {
        return value.get<long long>();
    } else if (value.is_number_float()) {
        d = value.get<double>();
    } else if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        d = std::strtod(s.c_str(), &end);
        while (end && (*end == ' ' || *end == '\t')) ++end;
        if (end == s.c_str() || *end != '\0') return std::nullopt;
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(d) || std::fabs(d) > 1e15) return std::nullopt;
    return static_cast<long long>(std::trunc(d));
}

} // namespace

std::optional<StorefrontItem> parseVariant(const nlohmann::json& variant) {
    if (!variant.is_object()) {
        return std::nullopt;
    }

    const auto sku = variant.find("sku");
    if (sku == variant.end() || !sku->is_string() ||
        sku->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }

    const auto inventoryItem = variant.find("inventory_item_id");
    if (inventoryItem == variant.end()) {
        return std::nullopt;
    }
    std::string inventoryItemId = idToString(*inventoryItem);
    if (inventoryItemId.empty() || inventoryItemId == "0") {
        return std::nullopt;
    }

    StorefrontItem item;
    item.sku             = sku->get<std::string>();
    item.inventoryItemId = std::move(inventoryItemId);
    item.variantId       = variant.contains("id") ? idToString(variant["id"]) : "";
    item.currentPrice    = variant.contains("price") ? priceText(variant["price"])
                                                     : "0.0";

    if (variant.contains("compare_at_price")) {
        const auto& compareAt = variant["compare_at_price"];
        if (compareAt.is_string() || compareAt.is_number()) {
            item.compareAtPrice = priceText(compareAt);
        }
    }
    return item;
}

ProductsPage parseProductsPage(const nlohmann::json& responseBody) {
    ProductsPage page;

    if (!responseBody.is_object() || !responseBody.contains("products") ||
        !responseBody["products"].is_array()) {
        throw std::runtime_error("Response missing 'products' array");
    }

    for (const auto& product : responseBody["products"]) {
        ++page.productCount;
        if (!product.is_object() || !product.contains("variants") ||
            !product["variants"].is_array()) {
            continue;
        }
        for (const auto& variant : product["variants"]) {
            auto item = parseVariant(variant);
            if (item) {
                page.items.push_back(std::move(*item));
            } else {
                ++page.skippedVariants;
            }
        }
    }

    return page;
}

std::vector<std::string>
extractGraphqlErrors(const nlohmann::json& responseBody) {
    std::vector<std::string> errors;

    if (responseBody.is_object() && responseBody.contains("errors")) {
        const auto& list = responseBody["errors"];
        if (list.is_array()) {
            for (const auto& err : list) {
                errors.push_back(err.is_object()
                    ? err.value("message", "Unknown GraphQL error")
                    : "Unknown GraphQL error");
            }
        } else if (list.is_string()) {
            // Shopify uses a bare string for auth / routing failures.
            errors.push_back(list.get<std::string>());
        }
    }
    return errors;
}

std::vector<std::string>
extractUserErrors(const nlohmann::json& responseBody, const std::string& field) {
    std::vector<std::string> errors;

    if (!responseBody.is_object()) return errors;
    const auto data = responseBody.find("data");
    if (data == responseBody.end() || !data->is_object()) return errors;
    const auto payload = data->find(field);
    if (payload == data->end() || !payload->is_object()) return errors;
    const auto userErrors = payload->find("userErrors");
    if (userErrors == payload->end() || !userErrors->is_array()) return errors;

    for (const auto& err : *userErrors) {
        errors.push_back(err.is_object()
            ? err.value("message", "Unknown user error")
            : "Unknown user error");
    }
    return errors;
}

std::string toGid(const std::string& type, const std::string& id) {
    if (id.rfind("gid://", 0) == 0) {
        return id;
    }
    return "gid://shopify/" + type + "/" + id;
}

std::optional<PosItem> parsePosRecord(const nlohmann::json& record) {
    if (!record.is_object() || !record.contains("ID") ||
        !record.contains("Qua") || !record.contains("Price")) {
        return std::nullopt;
    }

    const auto& id = record["ID"];
    if (!id.is_string() && !id.is_number()) {
        return std::nullopt;
    }

    PosItem item;
    item.sku = normalizeSkuValue(id.is_string() ? id : nlohmann::json(idToString(id)));
    if (item.sku.empty()) {
        return std::nullopt;
    }

    const auto quantity = parseQuantity(record["Qua"]);
    if (!quantity) {
        return std::nullopt;
    }
    // Oversold items can report negative stock; Shopify gets zero.
    item.quantity = *quantity < 0 ? 0 : *quantity;

    const auto price = Money::fromJson(record["Price"]);
    if (!price || price->cents() < 0) {
        return std::nullopt;
    }
    item.basePrice = *price;

    return item;
}

PosSnapshot parsePosInventory(const nlohmann::json& responseBody) {
    if (!responseBody.is_array()) {
        throw std::runtime_error("POS response is not a JSON array");
    }

    PosSnapshot snapshot;
    for (const auto& record : responseBody) {
        auto item = parsePosRecord(record);
        if (!item) {
            ++snapshot.skippedRecords;
            continue;
        }
        const std::string key = item->sku;
        if (snapshot.items.count(key) != 0 &&
            std::find(snapshot.duplicateSkus.begin(), snapshot.duplicateSkus.end(),
                      key) == snapshot.duplicateSkus.end()) {
            snapshot.duplicateSkus.push_back(key);
        }
        snapshot.items[key] = std::move(*item);
    }
    return snapshot;
}

} // namespace stock_sync
