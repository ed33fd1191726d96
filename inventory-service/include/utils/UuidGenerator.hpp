#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace omnitrack::utils {

/**
 * @brief Генератор идентификаторов событий, заказов и товаров
 *
 * Каждый поток держит свой генератор, общего состояния нет.
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4 для eventId
     */
    static std::string generate() {
        uint64_t high = next();
        uint64_t low = next();

        // version 4, variant 10xx
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        std::ostringstream out;
        out << std::hex << std::setfill('0')
            << std::setw(8) << (high >> 32) << '-'
            << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
            << std::setw(4) << (high & 0xFFFF) << '-'
            << std::setw(4) << (low >> 48) << '-'
            << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return out.str();
    }

    /**
     * @brief Короткий ID вида "ord-1a2b3c4d5e6f"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::ostringstream out;
        out << prefix << '-' << std::hex << std::setfill('0')
            << std::setw(12) << (next() & 0xFFFFFFFFFFFFULL);
        return out.str();
    }

private:
    static uint64_t next() {
        thread_local std::mt19937_64 engine(std::random_device{}());
        return engine();
    }
};

} // namespace omnitrack::utils
