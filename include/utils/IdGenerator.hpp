#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledgerflow::utils {

/**
 * @brief Генератор идентификаторов периодов и записей
 *
 * Формат: "prefix-xxxxxxxxxxxxxxxx" (64 бита случайного hex).
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static constexpr const char* PERIOD_PREFIX = "prd";
    static constexpr const char* ENTRY_PREFIX = "ent";

    /**
     * @param prefix Префикс ("prd", "ent")
     */
    static std::string generate(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
        return ss.str();
    }
};

} // namespace ledgerflow::utils
