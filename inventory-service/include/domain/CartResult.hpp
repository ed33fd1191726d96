#pragma once

#include "Cart.hpp"
#include "enums/ErrorCode.hpp"
#include <string>

namespace omnitrack::domain {

class CartResult {
public:
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    Cart cart;      ///< Состояние корзины после операции

    static CartResult ok(const Cart& cart) {
        CartResult result;
        result.success = true;
        result.cart = cart;
        return result;
    }

    static CartResult failure(ErrorCode error, const std::string& message) {
        CartResult result;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace omnitrack::domain
