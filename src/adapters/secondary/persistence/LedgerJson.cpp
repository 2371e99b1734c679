#include "adapters/secondary/persistence/LedgerJson.hpp"

namespace ledgerflow::adapters::secondary::json_codec {

nlohmann::json entryToJson(const domain::Entry& entry) {
    nlohmann::json j;
    j["id"] = entry.id;
    j["date"] = entry.date.toString();
    j["hours"] = entry.hours;
    j["note"] = entry.note;
    j["logged_at"] = entry.loggedAt.toString();
    return j;
}

domain::Entry entryFromJson(const nlohmann::json& j) {
    domain::Entry entry;
    entry.id = j.at("id").get<std::string>();
    entry.date = domain::Date::fromString(j.at("date").get<std::string>());
    entry.hours = j.at("hours").get<double>();
    entry.note = j.value("note", "");
    if (j.contains("logged_at")) {
        entry.loggedAt = domain::Timestamp::fromString(j["logged_at"].get<std::string>());
    }
    return entry;
}

nlohmann::json periodToJson(const domain::Period& period) {
    nlohmann::json j;
    j["id"] = period.id;
    j["start_date"] = period.startDate.toString();
    j["end_date"] = period.endDate ? nlohmann::json(period.endDate->toString()) : nlohmann::json(nullptr);

    j["entries"] = nlohmann::json::array();
    for (const auto& entry : period.entries) {
        j["entries"].push_back(entryToJson(entry));
    }
    return j;
}

domain::Period periodFromJson(const nlohmann::json& j) {
    domain::Period period(
        j.at("id").get<std::string>(),
        domain::Date::fromString(j.at("start_date").get<std::string>())
    );

    if (j.contains("end_date") && !j["end_date"].is_null()) {
        period.endDate = domain::Date::fromString(j["end_date"].get<std::string>());
    }

    if (j.contains("entries")) {
        for (const auto& e : j["entries"]) {
            period.entries.push_back(entryFromJson(e));
        }
    }
    return period;
}

nlohmann::json settingsToJson(const StoredSettings& settings) {
    nlohmann::json j;
    j["base_rate"] = settings.rateConfig.baseRate();
    j["use_tips"] = settings.rateConfig.includeTips();
    j["avg_tips"] = settings.rateConfig.avgTipRate();  // сохраняется и при выключенных чаевых
    j["active_period_id"] = settings.activePeriodId
        ? nlohmann::json(*settings.activePeriodId)
        : nlohmann::json(nullptr);
    return j;
}

StoredSettings settingsFromJson(const nlohmann::json& j) {
    StoredSettings settings;
    settings.rateConfig = domain::RateConfig(
        j.value("base_rate", domain::RateConfig::DEFAULT_BASE_RATE),
        j.value("use_tips", domain::RateConfig::DEFAULT_INCLUDE_TIPS),
        j.value("avg_tips", domain::RateConfig::DEFAULT_AVG_TIP_RATE)
    );

    if (j.contains("active_period_id") && !j["active_period_id"].is_null()) {
        settings.activePeriodId = j["active_period_id"].get<std::string>();
    }
    return settings;
}

} // namespace ledgerflow::adapters::secondary::json_codec
