/// @file test_mapping.cpp
/// Unit tests for mapping.hpp: products.json variants, GraphQL errors and
/// POS export records.

#include "mapping.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace stock_sync;
using json = nlohmann::json;

// ============================================================================
// parseVariant
// ============================================================================

TEST(ParseVariant, FullVariant) {
    json variant = {
        {"id", 39072856},
        {"sku", "TSHIRT-RED-L"},
        {"inventory_item_id", 808950810},
        {"price", "199.00"},
        {"compare_at_price", "249.00"}
    };

    auto item = parseVariant(variant);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->sku, "TSHIRT-RED-L");
    EXPECT_EQ(item->variantId, "39072856");
    EXPECT_EQ(item->inventoryItemId, "808950810");
    EXPECT_EQ(item->currentPrice, "199.00");
    ASSERT_TRUE(item->compareAtPrice.has_value());
    EXPECT_EQ(*item->compareAtPrice, "249.00");
}

TEST(ParseVariant, NullCompareAtIsAbsent) {
    json variant = {
        {"id", 1}, {"sku", "A"}, {"inventory_item_id", 2},
        {"price", "10.00"}, {"compare_at_price", nullptr}
    };

    auto item = parseVariant(variant);
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE(item->compareAtPrice.has_value());
}

TEST(ParseVariant, MissingPriceDefaultsToZero) {
    json variant = {{"id", 1}, {"sku", "A"}, {"inventory_item_id", 2}};

    auto item = parseVariant(variant);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->currentPrice, "0.0");
}

TEST(ParseVariant, NullPriceIsEmptyText) {
    json variant = {{"id", 1}, {"sku", "A"}, {"inventory_item_id", 2}, {"price", nullptr}};

    auto item = parseVariant(variant);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->currentPrice, "");
}

TEST(ParseVariant, WithoutSkuIsSkipped) {
    EXPECT_FALSE(parseVariant({{"id", 1}, {"inventory_item_id", 2}}).has_value());
    EXPECT_FALSE(parseVariant({{"id", 1}, {"sku", ""}, {"inventory_item_id", 2}}).has_value());
    EXPECT_FALSE(parseVariant({{"id", 1}, {"sku", nullptr}, {"inventory_item_id", 2}}).has_value());
}

TEST(ParseVariant, WithoutInventoryItemIsSkipped) {
    EXPECT_FALSE(parseVariant({{"id", 1}, {"sku", "A"}}).has_value());
    EXPECT_FALSE(parseVariant({{"id", 1}, {"sku", "A"}, {"inventory_item_id", nullptr}}).has_value());
    EXPECT_FALSE(parseVariant({{"id", 1}, {"sku", "A"}, {"inventory_item_id", 0}}).has_value());
}

TEST(ParseVariant, NonObjectIsSkipped) {
    EXPECT_FALSE(parseVariant(json("variant")).has_value());
}

// ============================================================================
// parseProductsPage
// ============================================================================

TEST(ParseProductsPage, CollectsVariantsAcrossProducts) {
    json body = {
        {"products", json::array({
            {{"id", 1}, {"variants", json::array({
                {{"id", 11}, {"sku", "A-1"}, {"inventory_item_id", 111}, {"price", "10.00"}},
                {{"id", 12}, {"sku", "A-2"}, {"inventory_item_id", 112}, {"price", "12.00"}}
            })}},
            {{"id", 2}, {"variants", json::array({
                {{"id", 21}, {"sku", ""}, {"inventory_item_id", 121}, {"price", "5.00"}},
                {{"id", 22}, {"sku", "B-2"}, {"inventory_item_id", 122}, {"price", "7.50"}}
            })}}
        })}
    };

    auto page = parseProductsPage(body);
    EXPECT_EQ(page.productCount, 2);
    EXPECT_EQ(page.skippedVariants, 1);
    ASSERT_EQ(page.items.size(), 3u);
    EXPECT_EQ(page.items[0].sku, "A-1");
    EXPECT_EQ(page.items[1].sku, "A-2");
    EXPECT_EQ(page.items[2].sku, "B-2");
}

TEST(ParseProductsPage, ProductWithoutVariantsIsTolerated) {
    json body = {{"products", json::array({{{"id", 1}}})}};

    auto page = parseProductsPage(body);
    EXPECT_EQ(page.productCount, 1);
    EXPECT_TRUE(page.items.empty());
}

TEST(ParseProductsPage, EmptyProducts) {
    auto page = parseProductsPage({{"products", json::array()}});
    EXPECT_TRUE(page.items.empty());
    EXPECT_EQ(page.productCount, 0);
}

TEST(ParseProductsPage, MissingProductsThrows) {
    EXPECT_THROW(parseProductsPage({{"errors", "Not Found"}}), std::runtime_error);
    EXPECT_THROW(parseProductsPage(json::array()), std::runtime_error);
    EXPECT_THROW(parseProductsPage({{"products", "oops"}}), std::runtime_error);
}

// ============================================================================
// extractGraphqlErrors / extractUserErrors
// ============================================================================

TEST(ExtractGraphqlErrors, NoErrors) {
    json response = {{"data", {{"inventorySetOnHandQuantities", {{"userErrors", json::array()}}}}}};
    EXPECT_TRUE(extractGraphqlErrors(response).empty());
}

TEST(ExtractGraphqlErrors, MultipleErrors) {
    json response = {
        {"data", nullptr},
        {"errors", json::array({
            {{"message", "Throttled"}},
            {{"message", "Field 'foo' doesn't exist"}}
        })}
    };

    auto errors = extractGraphqlErrors(response);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Throttled");
    EXPECT_EQ(errors[1], "Field 'foo' doesn't exist");
}

TEST(ExtractGraphqlErrors, ErrorWithoutMessageField) {
    json response = {{"errors", json::array({{{"code", "INTERNAL"}}})}};

    auto errors = extractGraphqlErrors(response);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Unknown GraphQL error");
}

TEST(ExtractGraphqlErrors, BareStringError) {
    json response = {{"errors", "[API] Invalid API key or access token"}};

    auto errors = extractGraphqlErrors(response);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "[API] Invalid API key or access token");
}

TEST(ExtractUserErrors, ReturnsMessages) {
    json response = {
        {"data", {{"inventorySetOnHandQuantities", {
            {"userErrors", json::array({
                {{"field", json::array({"input"})}, {"message", "The quantity can't be lower than -1000000000."}}
            })},
            {"inventoryAdjustmentGroup", nullptr}
        }}}}
    };

    auto errors = extractUserErrors(response, "inventorySetOnHandQuantities");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "The quantity can't be lower than -1000000000.");
}

TEST(ExtractUserErrors, MissingPayloadIsEmpty) {
    EXPECT_TRUE(extractUserErrors({{"data", nullptr}}, "inventorySetOnHandQuantities").empty());
    EXPECT_TRUE(extractUserErrors(json::object(), "inventorySetOnHandQuantities").empty());
}

TEST(ToGid, BuildsShopifyGid) {
    EXPECT_EQ(toGid("InventoryItem", "808950810"), "gid://shopify/InventoryItem/808950810");
    EXPECT_EQ(toGid("Location", "gid://shopify/Location/9"), "gid://shopify/Location/9");
}

// ============================================================================
// parsePosRecord / parsePosInventory
// ============================================================================

TEST(ParsePosRecord, StringFields) {
    auto item = parsePosRecord({{"ID", "ABC-1"}, {"Qua", "12.000"}, {"Price", "87.30"}});
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->sku, "ABC-1");
    EXPECT_EQ(item->quantity, 12);
    EXPECT_EQ(item->basePrice.cents(), 8730);
}

TEST(ParsePosRecord, NumericFields) {
    auto item = parsePosRecord({{"ID", 4401}, {"Qua", 3.9}, {"Price", 100}});
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->sku, "4401");
    EXPECT_EQ(item->quantity, 3);
    EXPECT_EQ(item->basePrice.cents(), 10000);
}

TEST(ParsePosRecord, IntegralFloatIdHasNoFraction) {
    auto item = parsePosRecord({{"ID", 4401.0}, {"Qua", 1}, {"Price", 1}});
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->sku, "4401");
}

TEST(ParsePosRecord, IdIsNormalized) {
    auto item = parsePosRecord({{"ID", "ABC-1\r\n"}, {"Qua", 1}, {"Price", 1}});
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->sku, "ABC-1");
}

TEST(ParsePosRecord, NegativeQuantityIsClampedToZero) {
    auto item = parsePosRecord({{"ID", "A"}, {"Qua", -4}, {"Price", 1}});
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->quantity, 0);
}

TEST(ParsePosRecord, MissingRequiredFieldIsRejected) {
    EXPECT_FALSE(parsePosRecord({{"Qua", 1}, {"Price", 1}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "A"}, {"Price", 1}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "A"}, {"Qua", 1}}).has_value());
}

TEST(ParsePosRecord, UnusableValuesAreRejected) {
    EXPECT_FALSE(parsePosRecord({{"ID", nullptr}, {"Qua", 1}, {"Price", 1}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "\t"}, {"Qua", 1}, {"Price", 1}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "A"}, {"Qua", "lots"}, {"Price", 1}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "A"}, {"Qua", 1}, {"Price", "n/a"}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "A"}, {"Qua", 1}, {"Price", -5}}).has_value());
    EXPECT_FALSE(parsePosRecord(json(nullptr)).has_value());
    EXPECT_FALSE(parsePosRecord(json::array()).has_value());
}

TEST(ParsePosRecord, QuantityBeyondSignedRangeIsRejected) {
    auto inRange = parsePosRecord({{"ID", "A"}, {"Qua", 42ull}, {"Price", 1}});
    ASSERT_TRUE(inRange.has_value());
    EXPECT_EQ(inRange->quantity, 42);

    EXPECT_FALSE(parsePosRecord({{"ID", "A"},
                                 {"Qua", 18446744073709551615ull},
                                 {"Price", 1}}).has_value());
    EXPECT_FALSE(parsePosRecord({{"ID", "A"},
                                 {"Qua", 9223372036854775808ull},
                                 {"Price", 1}}).has_value());
}

TEST(ParsePosInventory, SkipsMalformedAndCountsThem) {
    json body = json::array({
        {{"ID", "A"}, {"Qua", 5}, {"Price", 100}},
        {{"ID", "B"}, {"Price", 50}},
        nullptr,
        {{"ID", "C"}, {"Qua", "2"}, {"Price", "20.5"}}
    });

    auto snapshot = parsePosInventory(body);
    EXPECT_EQ(snapshot.items.size(), 2u);
    EXPECT_EQ(snapshot.skippedRecords, 2);
    EXPECT_NE(snapshot.find("A"), nullptr);
    EXPECT_EQ(snapshot.find("B"), nullptr);
    ASSERT_NE(snapshot.find("C"), nullptr);
    EXPECT_EQ(snapshot.find("C")->basePrice.cents(), 2050);
}

TEST(ParsePosInventory, DuplicateSkuKeepsLastRecord) {
    json body = json::array({
        {{"ID", "A"}, {"Qua", 5}, {"Price", 100}},
        {{"ID", "A\n"}, {"Qua", 9}, {"Price", 120}}
    });

    auto snapshot = parsePosInventory(body);
    ASSERT_EQ(snapshot.items.size(), 1u);
    EXPECT_EQ(snapshot.find("A")->quantity, 9);
    EXPECT_EQ(snapshot.find("A")->basePrice.cents(), 12000);
    ASSERT_EQ(snapshot.duplicateSkus.size(), 1u);
    EXPECT_EQ(snapshot.duplicateSkus[0], "A");
}

TEST(ParsePosInventory, RepeatedDuplicateIsListedOnce) {
    json body = json::array({
        {{"ID", "A"}, {"Qua", 1}, {"Price", 10}},
        {{"ID", "A"}, {"Qua", 2}, {"Price", 10}},
        {{"ID", "B"}, {"Qua", 1}, {"Price", 10}},
        {{"ID", "A"}, {"Qua", 3}, {"Price", 10}}
    });

    auto snapshot = parsePosInventory(body);
    EXPECT_EQ(snapshot.find("A")->quantity, 3);
    ASSERT_EQ(snapshot.duplicateSkus.size(), 1u);
    EXPECT_EQ(snapshot.duplicateSkus[0], "A");
}

TEST(ParsePosInventory, NonArrayThrows) {
    EXPECT_THROW(parsePosInventory({{"items", json::array()}}), std::runtime_error);
    EXPECT_THROW(parsePosInventory(json("error")), std::runtime_error);
}
