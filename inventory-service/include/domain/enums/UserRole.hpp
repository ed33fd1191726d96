#pragma once

#include <string>
#include <stdexcept>

namespace omnitrack::domain {

/**
 * @brief Роль пользователя платформы
 */
enum class UserRole {
    ADMIN,
    STAFF,
    CUSTOMER
};

inline std::string toString(UserRole role) {
    switch (role) {
        case UserRole::ADMIN:    return "ADMIN";
        case UserRole::STAFF:    return "STAFF";
        case UserRole::CUSTOMER: return "CUSTOMER";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline UserRole userRoleFromString(const std::string& str) {
    if (str == "ADMIN")    return UserRole::ADMIN;
    if (str == "STAFF")    return UserRole::STAFF;
    if (str == "CUSTOMER") return UserRole::CUSTOMER;
    throw std::invalid_argument("Unknown UserRole: " + str);
}

} // namespace omnitrack::domain
