#pragma once

#include "domain/Order.hpp"
#include "domain/OrderFilter.hpp"
#include <string>
#include <optional>
#include <vector>

namespace omnitrack::ports::output {

/**
 * @brief Интерфейс репозитория заказов
 * 
 * Output Port для сохранения и загрузки заказов.
 * Заказы не удаляются: CANCELLED - финальный статус, а не удаление.
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Сохранить новый заказ вместе с позициями
     * 
     * @throws std::exception при ошибке хранилища
     */
    virtual void save(const domain::Order& order) = 0;

    /**
     * @brief Найти заказ по ID
     *
     * @return nullopt только если заказа нет
     * @throws std::exception при ошибке хранилища
     */
    virtual std::optional<domain::Order> findById(const std::string& id) = 0;

    /**
     * @brief Найти заказы по фильтру
     * 
     * @return Заказы, новые первыми
     * @throws std::exception при ошибке хранилища
     */
    virtual std::vector<domain::Order> findAll(const domain::OrderFilter& filter) = 0;

    /**
     * @brief Обновить статус и атрибуцию заказа
     * 
     * Позиции заказа неизменяемы и не перезаписываются.
     * 
     * @return false если заказ не найден
     * @throws std::exception при ошибке хранилища
     */
    virtual bool update(const domain::Order& order) = 0;
};

} // namespace omnitrack::ports::output
