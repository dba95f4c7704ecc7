#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>

namespace bookkeeping::utils {

/**
 * @brief Генератор GUID для счетов, транзакций и проводок
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Генерирует UUID v4 без дефисов
     *
     * Формат: 32 hex-символа в нижнем регистре, xxxxxxxxxxxx4xxxyxxxxxxxxxxxxxxx
     */
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = (dist(gen) & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
        uint64_t low = (dist(gen) & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // variant

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(16) << high
           << std::setw(16) << low;
        return ss.str();
    }
};

} // namespace bookkeeping::utils
