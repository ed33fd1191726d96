#pragma once

#include "domain/Product.hpp"
#include "domain/ProductResult.hpp"
#include "domain/RequestContext.hpp"
#include "domain/Money.hpp"
#include "domain/StockMovement.hpp"
#include "domain/StockMovementFilter.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace omnitrack::ports::input {

/**
 * @brief Интерфейс управления складом и каталогом
 */
class IInventoryService {
public:
    virtual ~IInventoryService() = default;

    /**
     * @brief Добавить товар в каталог
     * 
     * Пустой id генерируется.
     * 
     * @return INVALID_PRODUCT при пустом имени, отрицательной цене,
     *         остатке или пороге; дубликат ID - тоже INVALID_PRODUCT
     */
    virtual domain::ProductResult addProduct(
        const domain::RequestContext& ctx,
        const domain::Product& product
    ) = 0;

    /**
     * @throws std::exception при ошибке хранилища
     */
    virtual std::optional<domain::Product> getProduct(const std::string& productId) = 0;

    /**
     * @brief Список товаров, опционально по категории
     * @throws std::exception при ошибке хранилища
     */
    virtual std::vector<domain::Product> listProducts(
        const std::optional<std::string>& category = std::nullopt
    ) = 0;

    /**
     * @brief Пополнить склад
     * 
     * @return INVALID_QUANTITY при quantity <= 0, NOT_FOUND для неизвестного товара
     * 
     * @note Публикует stock.restocked и пишет RESTOCK в историю движений
     */
    virtual domain::ProductResult restock(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t quantity
    ) = 0;

    /**
     * @brief Изменить порог "мало на складе"
     */
    virtual domain::ProductResult updateThreshold(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t threshold
    ) = 0;

    /**
     * @brief Изменить цену товара
     *
     * @return INVALID_PRODUCT при отрицательной цене, NOT_FOUND для неизвестного товара
     */
    virtual domain::ProductResult updatePrice(
        const domain::RequestContext& ctx,
        const std::string& productId,
        const domain::Money& price
    ) = 0;

    /**
     * @brief История движений стока (продажи, пополнения, отмены)
     *
     * @return Новые первыми, не больше filter.limit записей
     * @throws std::exception при ошибке хранилища
     */
    virtual std::vector<domain::StockMovement> listStockMovements(
        const domain::StockMovementFilter& filter
    ) = 0;

    /**
     * @brief Товары с остатком на пороге или ниже
     * 
     * Вычисляется заново при каждом вызове.
     */
    virtual std::vector<domain::Product> lowStockProducts() = 0;
};

} // namespace omnitrack::ports::input
