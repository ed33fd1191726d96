#pragma once

#include "domain/Product.hpp"
#include "domain/Money.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace omnitrack::ports::output {

/**
 * @brief Интерфейс каталога товаров
 * 
 * Output Port каталога. Ядро читает через него карточки для валидации
 * и снимка цен.
 * availableQuantity здесь не изменяется - это зона IStockLedger.
 *
 * Все методы пробрасывают std::exception при ошибке хранилища:
 * "не найдено" и "хранилище недоступно" не смешиваются.
 */
class IProductRepository {
public:
    virtual ~IProductRepository() = default;

    /**
     * @brief Добавить новый товар вместе с начальным остатком
     * 
     * @return false если товар с таким ID уже есть
     * @throws std::exception при ошибке хранилища
     */
    virtual bool create(const domain::Product& product) = 0;

    /**
     * @brief Найти товар по ID
     * 
     * @return Product с текущим остатком или nullopt, если товара нет
     */
    virtual std::optional<domain::Product> findById(const std::string& id) = 0;

    /**
     * @brief Все товары, отсортированные по имени
     */
    virtual std::vector<domain::Product> findAll() = 0;

    /**
     * @brief Изменить порог "мало на складе"
     * 
     * @return false если товар не найден
     * @throws std::exception при ошибке хранилища
     */
    virtual bool updateThreshold(const std::string& id, int64_t threshold) = 0;

    /**
     * @brief Изменить цену товара
     *
     * Оформленные заказы не меняются: цена в них зафиксирована снимком.
     *
     * @return false если товар не найден
     */
    virtual bool updatePrice(const std::string& id, const domain::Money& price) = 0;

    virtual size_t count() = 0;
};

} // namespace omnitrack::ports::output
