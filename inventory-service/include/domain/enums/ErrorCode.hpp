#pragma once

#include <string>

namespace omnitrack::domain {

/**
 * @brief Код ошибки операции ядра
 *
 * Все ошибки восстановимы на стороне вызывающего: операция,
 * вернувшая ошибку, не меняет состояние.
 */
enum class ErrorCode {
    NONE,
    NOT_FOUND,            ///< Товар или заказ не существует
    INVALID_CART,         ///< Некорректный запрос на оформление
    INSUFFICIENT_STOCK,   ///< Запрошено больше, чем доступно
    ILLEGAL_TRANSITION,   ///< Переход статуса не разрешён
    INVALID_QUANTITY,     ///< Неположительное количество
    INVALID_PRODUCT,      ///< Некорректные данные карточки товара
    STORAGE_ERROR         ///< Ошибка адаптера хранилища
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:               return "NONE";
        case ErrorCode::NOT_FOUND:          return "NOT_FOUND";
        case ErrorCode::INVALID_CART:       return "INVALID_CART";
        case ErrorCode::INSUFFICIENT_STOCK: return "INSUFFICIENT_STOCK";
        case ErrorCode::ILLEGAL_TRANSITION: return "ILLEGAL_TRANSITION";
        case ErrorCode::INVALID_QUANTITY:   return "INVALID_QUANTITY";
        case ErrorCode::INVALID_PRODUCT:    return "INVALID_PRODUCT";
        case ErrorCode::STORAGE_ERROR:      return "STORAGE_ERROR";
    }
    return "UNKNOWN";
}

} // namespace omnitrack::domain
