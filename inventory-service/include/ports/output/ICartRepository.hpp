#pragma once

#include "domain/Cart.hpp"
#include <string>
#include <optional>

namespace omnitrack::ports::output {

/**
 * @brief Хранилище корзин покупателей
 *
 * Все методы пробрасывают std::exception при ошибке хранилища.
 */
class ICartRepository {
public:
    virtual ~ICartRepository() = default;

    virtual std::optional<domain::Cart> findByUserId(const std::string& userId) = 0;

    virtual void save(const domain::Cart& cart) = 0;

    /**
     * @return true если корзина была
     */
    virtual bool remove(const std::string& userId) = 0;
};

} // namespace omnitrack::ports::output
