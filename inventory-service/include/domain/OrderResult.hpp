#pragma once

#include "Order.hpp"
#include "enums/ErrorCode.hpp"
#include <optional>
#include <string>

namespace omnitrack::domain {

/**
 * @brief Результат оформления заказа или смены его статуса
 */
class OrderResult {
public:
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    std::optional<Order> order;     ///< Заказ после операции (только при успехе)

    static OrderResult ok(const Order& order, const std::string& message = "") {
        OrderResult result;
        result.success = true;
        result.order = order;
        result.message = message;
        return result;
    }

    static OrderResult failure(ErrorCode error, const std::string& message) {
        OrderResult result;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace omnitrack::domain
