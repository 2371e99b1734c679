#pragma once

#include "ports/output/IClock.hpp"

namespace ledgerflow::tests {

/**
 * @brief Часы с заданными датой и временем
 */
class FixedClock : public ports::output::IClock {
public:
    FixedClock()
        : today_(2025, 12, 16)
        , now_(domain::Timestamp::fromString("2025-12-16 18:30:00")) {}

    FixedClock(const domain::Date& today, const domain::Timestamp& now)
        : today_(today), now_(now) {}

    void setToday(const domain::Date& today) { today_ = today; }
    void setNow(const domain::Timestamp& now) { now_ = now; }

    domain::Date today() const override { return today_; }
    domain::Timestamp now() const override { return now_; }

private:
    domain::Date today_;
    domain::Timestamp now_;
};

} // namespace ledgerflow::tests
