#pragma once

#include "ports/output/IPersistenceGateway.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace ledgerflow::adapters::secondary {

/**
 * @brief In-memory реализация хранилища леджера
 *
 * Данные живут до завершения процесса (LEDGERFLOW_STORAGE=memory и тесты).
 */
class InMemoryPersistenceGateway : public ports::output::IPersistenceGateway {
public:
    domain::LedgerSnapshot loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::LedgerSnapshot snapshot;
        snapshot.periods = periods_;
        snapshot.rateConfig = rateConfig_;
        snapshot.activePeriodId = activePeriodId_;
        return snapshot;
    }

    void saveEntry(const std::string& periodId, const domain::Entry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto period = findPeriod(periodId);
        if (period == periods_.end()) {
            throw std::runtime_error("Period not found: " + periodId);
        }

        auto existing = std::find_if(period->entries.begin(), period->entries.end(),
            [&entry](const domain::Entry& e) { return e.id == entry.id; });
        if (existing != period->entries.end()) {
            *existing = entry;
        } else {
            period->entries.push_back(entry);
        }
    }

    void savePeriodBoundary(const domain::Period& period) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto existing = findPeriod(period.id);
        if (existing != periods_.end()) {
            existing->startDate = period.startDate;
            existing->endDate = period.endDate;
            return;
        }

        domain::Period boundary(period.id, period.startDate);
        boundary.endDate = period.endDate;
        periods_.push_back(boundary);
    }

    void removePeriod(const std::string& periodId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto period = findPeriod(periodId);
        if (period != periods_.end()) {
            periods_.erase(period);
        }
    }

    void saveRateConfig(const domain::RateConfig& rateConfig) override {
        std::lock_guard<std::mutex> lock(mutex_);
        rateConfig_ = rateConfig;
    }

    void saveActivePeriodId(const std::optional<std::string>& periodId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        activePeriodId_ = periodId;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        periods_.clear();
        rateConfig_ = domain::RateConfig();
        activePeriodId_.reset();
    }

    // Test helpers
    size_t periodCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return periods_.size();
    }

    size_t entryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& period : periods_) {
            count += period.entries.size();
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::Period> periods_;
    domain::RateConfig rateConfig_;
    std::optional<std::string> activePeriodId_;

    std::vector<domain::Period>::iterator findPeriod(const std::string& periodId) {
        return std::find_if(periods_.begin(), periods_.end(),
            [&periodId](const domain::Period& p) { return p.id == periodId; });
    }
};

} // namespace ledgerflow::adapters::secondary
