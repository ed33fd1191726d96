#pragma once

#include "domain/StockResult.hpp"
#include "domain/ItemQuantities.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::ports::output {

/**
 * @brief Складской учёт доступных остатков
 * 
 * Единственный владелец availableQuantity. Остаток никогда не уходит
 * в минус. reserve и release по одному товару взаимно исключают друг
 * друга: сумма успешных параллельных списаний не превышает остатка
 * на начало пакета.
 * 
 * Ошибки:
 * - NOT_FOUND - неизвестный товар
 * - INSUFFICIENT_STOCK - quantity > available
 * - INVALID_QUANTITY - quantity <= 0
 * 
 * @example
 * ```cpp
 * // Оформление заказа
 * auto reserved = ledger->reserveAll({{"prd-1", 2}, {"prd-2", 1}});
 * if (!reserved.success) {
 *     return OrderResult::failure(reserved.error, reserved.message);
 * }
 * 
 * // Отмена заказа
 * ledger->releaseAll({{"prd-1", 2}, {"prd-2", 1}});
 * ```
 */
class IStockLedger {
public:
    virtual ~IStockLedger() = default;

    /**
     * @brief Атомарно списать quantity
     * 
     * @return Новый остаток при успехе
     */
    virtual domain::StockResult reserve(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Атомарно вернуть quantity
     * 
     * Верхней границы нет.
     * 
     * @return Новый остаток при успехе
     */
    virtual domain::StockResult release(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Текущий остаток без изменений
     */
    virtual domain::StockResult peek(const std::string& productId) = 0;

    /**
     * @brief Списать все позиции как одно целое
     * 
     * Если хотя бы одна позиция не проходит, не списывается ничего.
     * Эксклюзивный доступ ко всем товарам удерживается на всё время
     * проверки и списания.
     */
    virtual domain::StockResult reserveAll(const domain::ItemQuantities& lines) = 0;

    /**
     * @brief Вернуть все позиции как одно целое
     * 
     * Если какой-то товар не найден, не возвращается ничего.
     */
    virtual domain::StockResult releaseAll(const domain::ItemQuantities& lines) = 0;
};

} // namespace omnitrack::ports::output
