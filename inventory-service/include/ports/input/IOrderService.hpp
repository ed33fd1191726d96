#pragma once

#include "domain/Order.hpp"
#include "domain/OrderFilter.hpp"
#include "domain/OrderResult.hpp"
#include "domain/ItemQuantities.hpp"
#include "domain/RequestContext.hpp"
#include <string>
#include <vector>
#include <optional>

namespace omnitrack::ports::input {

/**
 * @brief Интерфейс сервиса заказов
 * 
 * Input Port для оформления заказов и управления их жизненным циклом.
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @brief Оформить заказ из набора позиций
     * 
     * @param ctx Контекст запроса (владелец заказа)
     * @param items productId → количество
     * @return Заказ в статусе PLACED или ошибка INVALID_CART / INSUFFICIENT_STOCK /
     *         STORAGE_ERROR
     * 
     * @note Публикует order.placed и stock.low при успехе
     */
    virtual domain::OrderResult placeOrder(
        const domain::RequestContext& ctx,
        const domain::ItemQuantities& items
    ) = 0;

    /**
     * @brief Перевести заказ в новый статус
     * 
     * @return NOT_FOUND / ILLEGAL_TRANSITION / STORAGE_ERROR или заказ после перехода
     * 
     * @note Переход в CANCELLED возвращает сток всех позиций в том же шаге
     */
    virtual domain::OrderResult transitionOrder(
        const domain::RequestContext& ctx,
        const std::string& orderId,
        domain::OrderStatus target
    ) = 0;

    /**
     * @brief Отменить заказ (PLACED или PAID)
     */
    virtual domain::OrderResult cancelOrder(
        const domain::RequestContext& ctx,
        const std::string& orderId
    ) = 0;

    /**
     * @return nullopt только если заказа нет
     * @throws std::exception при ошибке хранилища
     */
    virtual std::optional<domain::Order> getOrder(const std::string& orderId) = 0;

    /**
     * @brief Заказы по фильтру, новые первыми
     * @throws std::exception при ошибке хранилища
     */
    virtual std::vector<domain::Order> listOrders(const domain::OrderFilter& filter) = 0;

    /**
     * @brief Заказы покупателя
     */
    virtual std::vector<domain::Order> listUserOrders(const std::string& userId) = 0;

    /**
     * @brief Заказы, ожидающие действий персонала (PLACED и PAID)
     */
    virtual std::vector<domain::Order> listActionableOrders() = 0;
};

} // namespace omnitrack::ports::input
