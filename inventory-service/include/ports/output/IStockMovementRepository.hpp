#pragma once

#include "domain/StockMovement.hpp"
#include "domain/StockMovementFilter.hpp"
#include <vector>

namespace omnitrack::ports::output {

/**
 * @brief Журнал движений стока
 *
 * Записи только добавляются. Все методы бросают std::exception
 * при ошибке хранилища.
 */
class IStockMovementRepository {
public:
    virtual ~IStockMovementRepository() = default;

    /**
     * @brief Добавить записи одним пакетом (все или ни одной)
     */
    virtual void append(const std::vector<domain::StockMovement>& movements) = 0;

    /**
     * @return Записи по фильтру, новые первыми, не больше filter.limit
     */
    virtual std::vector<domain::StockMovement> findAll(const domain::StockMovementFilter& filter) = 0;
};

} // namespace omnitrack::ports::output
