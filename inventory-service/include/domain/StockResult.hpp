#pragma once

#include "enums/ErrorCode.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Результат операции со складом
 *
 * При успехе quantity - новое доступное количество (для пакетных
 * операций - суммарное число единиц). При ошибке productId указывает
 * на товар, из-за которого операция отклонена.
 */
struct StockResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string productId;
    int64_t quantity = 0;
    std::string message;

    static StockResult ok(const std::string& productId, int64_t quantity) {
        StockResult result;
        result.success = true;
        result.productId = productId;
        result.quantity = quantity;
        return result;
    }

    static StockResult failure(ErrorCode error, const std::string& productId, const std::string& message) {
        StockResult result;
        result.error = error;
        result.productId = productId;
        result.message = message;
        return result;
    }
};

} // namespace omnitrack::domain
