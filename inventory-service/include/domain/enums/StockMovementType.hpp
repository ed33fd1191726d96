#pragma once

#include <string>
#include <stdexcept>

namespace omnitrack::domain {

/**
 * @brief Причина движения стока
 */
enum class StockMovementType {
    SALE,     ///< Списание при оформлении заказа
    RESTOCK,  ///< Пополнение склада
    CANCEL    ///< Возврат стока при отмене заказа
};

inline std::string toString(StockMovementType type) {
    switch (type) {
        case StockMovementType::SALE:    return "sale";
        case StockMovementType::RESTOCK: return "restock";
        case StockMovementType::CANCEL:  return "cancel";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline StockMovementType stockMovementTypeFromString(const std::string& str) {
    if (str == "sale")    return StockMovementType::SALE;
    if (str == "restock") return StockMovementType::RESTOCK;
    if (str == "cancel")  return StockMovementType::CANCEL;
    throw std::invalid_argument("Unknown StockMovementType: " + str);
}

} // namespace omnitrack::domain
