#pragma once

#include "ports/output/IPersistenceGateway.hpp"
#include "settings/DbSettings.hpp"
#include "LedgerJson.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace ledgerflow::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища леджера
 *
 * Таблицы periods, entries и settings создаются при подключении,
 * если их нет. Порядок периодов и записей - порядок вставки (seq).
 * Настройки хранятся одним JSON под ключом "ledger".
 *
 * Каждый метод выполняется в одной транзакции.
 */
class PostgresPersistenceGateway : public ports::output::IPersistenceGateway {
public:
    explicit PostgresPersistenceGateway(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPersistence] Connecting to " << settings_->getHost()
                  << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            createSchema();
            std::cout << "[PostgresPersistence] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresPersistenceGateway() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    domain::LedgerSnapshot loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            domain::LedgerSnapshot snapshot;

            auto periods = txn.exec(
                R"(
                    SELECT id, start_date::text AS start_date, end_date::text AS end_date
                    FROM periods
                    ORDER BY seq
                )"
            );
            for (const auto& row : periods) {
                domain::Period period(
                    row["id"].as<std::string>(),
                    domain::Date::fromString(row["start_date"].as<std::string>())
                );
                if (!row["end_date"].is_null()) {
                    period.endDate = domain::Date::fromString(row["end_date"].as<std::string>());
                }
                snapshot.periods.push_back(period);
            }

            auto entries = txn.exec(
                R"(
                    SELECT id, period_id, work_date::text AS work_date, hours, note,
                           to_char(logged_at, 'YYYY-MM-DD HH24:MI:SS') AS logged_at
                    FROM entries
                    ORDER BY seq
                )"
            );
            for (const auto& row : entries) {
                const std::string periodId = row["period_id"].as<std::string>();
                for (auto& period : snapshot.periods) {
                    if (period.id == periodId) {
                        period.entries.push_back(rowToEntry(row));
                        break;
                    }
                }
            }

            auto settingsRow = txn.exec_params(
                "SELECT value FROM settings WHERE key = $1",
                SETTINGS_KEY
            );
            txn.commit();

            if (!settingsRow.empty()) {
                auto stored = readSettings(settingsRow[0]["value"].as<std::string>());
                snapshot.rateConfig = stored.rateConfig;
                snapshot.activePeriodId = stored.activePeriodId;
            }

            std::cout << "[PostgresPersistence] Loaded " << snapshot.periods.size() << " periods" << std::endl;
            return snapshot;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] loadAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void saveEntry(const std::string& periodId, const domain::Entry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO entries (id, period_id, work_date, hours, note, logged_at)
                    VALUES ($1, $2, $3::date, $4, $5, $6::timestamp)
                    ON CONFLICT (id) DO UPDATE SET
                        work_date = EXCLUDED.work_date,
                        hours = EXCLUDED.hours,
                        note = EXCLUDED.note
                )",
                entry.id,
                periodId,
                entry.date.toString(),
                entry.hours,
                entry.note,
                entry.loggedAt.toString()
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] saveEntry() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void savePeriodBoundary(const domain::Period& period) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            std::optional<std::string> endDate;
            if (period.endDate) {
                endDate = period.endDate->toString();
            }

            txn.exec_params(
                R"(
                    INSERT INTO periods (id, start_date, end_date)
                    VALUES ($1, $2::date, $3::date)
                    ON CONFLICT (id) DO UPDATE SET
                        start_date = EXCLUDED.start_date,
                        end_date = EXCLUDED.end_date
                )",
                period.id,
                period.startDate.toString(),
                endDate
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] savePeriodBoundary() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void removePeriod(const std::string& periodId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params("DELETE FROM entries WHERE period_id = $1", periodId);
            txn.exec_params("DELETE FROM periods WHERE id = $1", periodId);
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] removePeriod() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void saveRateConfig(const domain::RateConfig& rateConfig) override {
        updateSettings([&rateConfig](StoredSettings& stored) {
            stored.rateConfig = rateConfig;
        });
    }

    void saveActivePeriodId(const std::optional<std::string>& periodId) override {
        updateSettings([&periodId](StoredSettings& stored) {
            stored.activePeriodId = periodId;
        });
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec("DELETE FROM entries");
            txn.exec("DELETE FROM periods");
            txn.exec("DELETE FROM settings");
            txn.commit();

            std::cout << "[PostgresPersistence] Storage cleared" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] clear() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool isConnected() const {
        return connection_ && connection_->is_open();
    }

private:
    static constexpr const char* SETTINGS_KEY = "ledger";

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void createSchema() {
        pqxx::work txn(*connection_);
        txn.exec(
            R"(
                CREATE TABLE IF NOT EXISTS periods (
                    id TEXT PRIMARY KEY,
                    seq BIGSERIAL,
                    start_date DATE NOT NULL,
                    end_date DATE
                )
            )"
        );
        txn.exec(
            R"(
                CREATE TABLE IF NOT EXISTS entries (
                    id TEXT PRIMARY KEY,
                    seq BIGSERIAL,
                    period_id TEXT NOT NULL REFERENCES periods(id) ON DELETE CASCADE,
                    work_date DATE NOT NULL,
                    hours DOUBLE PRECISION NOT NULL CHECK (hours > 0),
                    note TEXT NOT NULL DEFAULT '',
                    logged_at TIMESTAMP NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC')
                )
            )"
        );
        txn.exec(
            R"(
                CREATE TABLE IF NOT EXISTS settings (
                    key TEXT PRIMARY KEY,
                    value TEXT NOT NULL
                )
            )"
        );
        txn.commit();
    }

    /**
     * @brief Прочитать-изменить-записать настройки в одной транзакции
     */
    template <typename Mutator>
    void updateSettings(Mutator mutate) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT value FROM settings WHERE key = $1 FOR UPDATE",
                SETTINGS_KEY
            );

            StoredSettings stored;
            if (!result.empty()) {
                stored = readSettings(result[0]["value"].as<std::string>());
            }
            mutate(stored);

            txn.exec_params(
                R"(
                    INSERT INTO settings (key, value) VALUES ($1, $2)
                    ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value
                )",
                SETTINGS_KEY,
                json_codec::settingsToJson(stored).dump()
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] settings update failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Разобрать JSON настроек; при ошибке - значения по умолчанию
     */
    static StoredSettings readSettings(const std::string& value) {
        try {
            return json_codec::settingsFromJson(nlohmann::json::parse(value));
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistence] Stored settings are corrupt, defaults will be used: "
                      << e.what() << std::endl;
            return StoredSettings();
        }
    }

    static domain::Entry rowToEntry(const pqxx::row& row) {
        domain::Entry entry;
        entry.id = row["id"].as<std::string>();
        entry.date = domain::Date::fromString(row["work_date"].as<std::string>());
        entry.hours = row["hours"].as<double>();
        if (!row["note"].is_null()) {
            entry.note = row["note"].as<std::string>();
        }
        entry.loggedAt = domain::Timestamp::fromString(row["logged_at"].as<std::string>());
        return entry;
    }
};

} // namespace ledgerflow::adapters::secondary
