#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace ledgerflow::adapters::secondary {

/**
 * @brief Системные часы
 *
 * today() - локальная дата, now() - текущий момент.
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Date today() const override {
        return domain::Date::fromTimePoint(std::chrono::system_clock::now());
    }

    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace ledgerflow::adapters::secondary
