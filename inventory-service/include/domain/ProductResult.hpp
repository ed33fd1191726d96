#pragma once

#include "Product.hpp"
#include "enums/ErrorCode.hpp"
#include <optional>
#include <string>

namespace omnitrack::domain {

/**
 * @brief Результат операции управления каталогом
 */
class ProductResult {
public:
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    std::optional<Product> product;

    static ProductResult ok(const Product& product) {
        ProductResult result;
        result.success = true;
        result.product = product;
        return result;
    }

    static ProductResult failure(ErrorCode error, const std::string& message) {
        ProductResult result;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace omnitrack::domain
