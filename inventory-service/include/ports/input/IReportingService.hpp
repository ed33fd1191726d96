#pragma once

#include "domain/OrderMetrics.hpp"
#include "domain/DashboardSnapshot.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <vector>
#include <cstddef>

namespace omnitrack::ports::input {

/**
 * @brief Интерфейс аналитики для панелей по ролям
 * 
 * Только чтение: не изменяет ни склад, ни заказы.
 */
class IReportingService {
public:
    virtual ~IReportingService() = default;

    virtual domain::OrderMetrics metrics(
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt
    ) = 0;

    /**
     * @brief Товары с наибольшей выручкой (PAID + DELIVERED)
     */
    virtual std::vector<domain::ProductRevenue> topProducts(size_t limit) = 0;

    /**
     * @brief Согласованный снимок заказов и склада
     */
    virtual domain::DashboardSnapshot dashboard(
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt
    ) = 0;
};

} // namespace omnitrack::ports::input
