#pragma once

#include <map>
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief productId → количество
 *
 * std::map: ключи упорядочены, пакетные операции склада
 * захватывают товары в этом порядке.
 */
using ItemQuantities = std::map<std::string, int64_t>;

} // namespace omnitrack::domain
