#pragma once

#include <string>
#include <stdexcept>

namespace omnitrack::domain {

/**
 * @brief Статус заказа
 *
 * Допустимые переходы:
 * ```
 * PLACED ──► PAID ──► DELIVERED
 *   │          │
 *   └──────────┴────► CANCELLED
 * ```
 * DELIVERED и CANCELLED финальные.
 */
enum class OrderStatus {
    PLACED,     ///< Оформлен, сток зарезервирован
    PAID,       ///< Оплачен
    DELIVERED,  ///< Доставлен
    CANCELLED   ///< Отменён, сток возвращён
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PLACED:    return "PLACED";
        case OrderStatus::PAID:      return "PAID";
        case OrderStatus::DELIVERED: return "DELIVERED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "PLACED")    return OrderStatus::PLACED;
    if (str == "PAID")      return OrderStatus::PAID;
    if (str == "DELIVERED") return OrderStatus::DELIVERED;
    if (str == "CANCELLED") return OrderStatus::CANCELLED;
    throw std::invalid_argument("Unknown OrderStatus: " + str);
}

/**
 * @brief Является ли статус финальным (заказ больше не может измениться)
 */
inline bool isTerminalStatus(OrderStatus status) {
    switch (status) {
        case OrderStatus::PLACED:
        case OrderStatus::PAID:
            return false;
        case OrderStatus::DELIVERED:
        case OrderStatus::CANCELLED:
            return true;
    }
    return true;
}

/**
 * @brief Таблица переходов
 *
 * Переход в тот же статус запрещён.
 */
inline bool isTransitionAllowed(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PLACED:
            return to == OrderStatus::PAID || to == OrderStatus::CANCELLED;
        case OrderStatus::PAID:
            return to == OrderStatus::DELIVERED || to == OrderStatus::CANCELLED;
        case OrderStatus::DELIVERED:
        case OrderStatus::CANCELLED:
            return false;
    }
    return false;
}

/**
 * @brief Учитывается ли заказ в выручке
 *
 * PLACED ещё не выручка, CANCELLED не выручка никогда.
 */
inline bool isRevenueStatus(OrderStatus status) {
    return status == OrderStatus::PAID || status == OrderStatus::DELIVERED;
}

/**
 * @brief Требует ли заказ действий персонала
 */
inline bool isActionable(OrderStatus status) {
    return status == OrderStatus::PLACED || status == OrderStatus::PAID;
}

} // namespace omnitrack::domain
