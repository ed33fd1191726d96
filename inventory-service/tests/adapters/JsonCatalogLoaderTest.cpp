#include <gtest/gtest.h>
#include "adapters/secondary/catalog/JsonCatalogLoader.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace omnitrack::adapters::secondary;

class JsonCatalogLoaderTest : public ::testing::Test {
protected:
    JsonCatalogLoader loader_{10, "USD"};
};

TEST_F(JsonCatalogLoaderTest, Parse_FullEntry) {
    auto products = loader_.parse(R"([
        {
            "id": "prd-widget",
            "name": "Widget",
            "description": "Blue widget",
            "category": "Hardware",
            "sku": "WID-001",
            "price": 12.50,
            "stock": 5,
            "lowStockThreshold": 2
        }
    ])");

    ASSERT_EQ(products.size(), 1u);
    const auto& widget = products[0];
    EXPECT_EQ(widget.id, "prd-widget");
    EXPECT_EQ(widget.name, "Widget");
    EXPECT_EQ(widget.category, "Hardware");
    EXPECT_EQ(widget.sku, "WID-001");
    EXPECT_EQ(widget.price.cents, 1250);
    EXPECT_EQ(widget.price.currency, "USD");
    EXPECT_EQ(widget.availableQuantity, 5);
    EXPECT_EQ(widget.lowStockThreshold, 2);
}

TEST_F(JsonCatalogLoaderTest, Parse_Defaults) {
    auto products = loader_.parse(R"([{"name": "Gadget", "price": 4.99}])");

    ASSERT_EQ(products.size(), 1u);
    EXPECT_TRUE(products[0].id.empty());
    EXPECT_EQ(products[0].availableQuantity, 0);
    EXPECT_EQ(products[0].lowStockThreshold, 10);
}

TEST_F(JsonCatalogLoaderTest, Parse_EmptyArray) {
    EXPECT_TRUE(loader_.parse("[]").empty());
}

TEST_F(JsonCatalogLoaderTest, Parse_Invalid_Throws) {
    EXPECT_THROW(loader_.parse("{not json"), std::runtime_error);
    EXPECT_THROW(loader_.parse(R"({"name": "Widget"})"), std::runtime_error);
    EXPECT_THROW(loader_.parse(R"([{"name": "Widget"}])"), std::runtime_error);
    EXPECT_THROW(loader_.parse(R"([{"name": "Widget", "price": "cheap"}])"), std::runtime_error);
}

TEST_F(JsonCatalogLoaderTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "omnitrack_catalog_test.json";
    {
        std::ofstream out(path);
        out << R"([{"name": "Widget", "price": 1.00, "stock": 3}])";
    }

    auto products = loader_.loadFromFile(path);
    std::remove(path.c_str());

    ASSERT_EQ(products.size(), 1u);
    EXPECT_EQ(products[0].availableQuantity, 3);
}

TEST_F(JsonCatalogLoaderTest, LoadFromFile_Missing_Throws) {
    EXPECT_THROW(loader_.loadFromFile("/nonexistent/omnitrack/catalog.json"), std::runtime_error);
}
