#pragma once

#include "ports/output/IStockLedger.hpp"
#include <gmock/gmock.h>

namespace omnitrack::tests {

class MockStockLedger : public ports::output::IStockLedger {
public:
    MOCK_METHOD(domain::StockResult, reserve, (const std::string& productId, int64_t quantity), (override));
    MOCK_METHOD(domain::StockResult, release, (const std::string& productId, int64_t quantity), (override));
    MOCK_METHOD(domain::StockResult, peek, (const std::string& productId), (override));
    MOCK_METHOD(domain::StockResult, reserveAll, (const domain::ItemQuantities& lines), (override));
    MOCK_METHOD(domain::StockResult, releaseAll, (const domain::ItemQuantities& lines), (override));
};

} // namespace omnitrack::tests
