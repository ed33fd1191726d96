#pragma once

#include "domain/Cart.hpp"
#include "domain/CartResult.hpp"
#include "domain/OrderResult.hpp"
#include "domain/RequestContext.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::ports::input {

/**
 * @brief Интерфейс корзины покупателя
 * 
 * Корзина принадлежит пользователю из RequestContext.
 * Сток не резервируется до checkout().
 */
class ICartService {
public:
    virtual ~ICartService() = default;

    /**
     * @brief Добавить товар (количество суммируется)
     */
    virtual domain::CartResult addItem(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t quantity
    ) = 0;

    /**
     * @brief Установить количество (0 удаляет позицию)
     */
    virtual domain::CartResult setQuantity(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t quantity
    ) = 0;

    virtual domain::CartResult removeItem(
        const domain::RequestContext& ctx,
        const std::string& productId
    ) = 0;

    /**
     * @throws std::exception при ошибке хранилища
     */
    virtual domain::Cart getCart(const std::string& userId) = 0;

    /**
     * @throws std::exception при ошибке хранилища
     */
    virtual void clear(const domain::RequestContext& ctx) = 0;

    /**
     * @brief Оформить заказ из корзины
     * 
     * Корзина очищается только при успешном оформлении.
     */
    virtual domain::OrderResult checkout(const domain::RequestContext& ctx) = 0;
};

} // namespace omnitrack::ports::input
