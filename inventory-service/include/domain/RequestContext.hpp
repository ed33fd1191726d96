#pragma once

#include "enums/UserRole.hpp"
#include <string>

namespace omnitrack::domain {

/**
 * @brief Контекст запроса
 *
 * Передаётся в каждый вызов вместо глобального состояния сессии.
 * Ядро использует только userId для атрибуции; авторизация по роли
 * остаётся на стороне вызывающего слоя.
 */
struct RequestContext {
    std::string userId;
    UserRole role = UserRole::CUSTOMER;

    RequestContext() = default;

    RequestContext(const std::string& userId, UserRole role)
        : userId(userId), role(role) {}
};

} // namespace omnitrack::domain
