#include "application/ExportFormatter.hpp"

#include <algorithm>
#include <sstream>

namespace ledgerflow::application {

namespace {

struct ExportRow {
    const domain::Period* period;
    const domain::Entry* entry;
};

} // namespace

std::string ExportFormatter::format(
    const std::vector<domain::Period>& periods,
    const domain::RateConfig& rateConfig,
    const domain::Timestamp& generatedAt
) {
    std::vector<ExportRow> rows;
    for (const auto& period : periods) {
        for (const auto& entry : period.entries) {
            rows.push_back({&period, &entry});
        }
    }

    // stable_sort: при равных датах сохраняется порядок добавления
    std::stable_sort(rows.begin(), rows.end(), [](const ExportRow& a, const ExportRow& b) {
        if (a.period->startDate != b.period->startDate) {
            return a.period->startDate < b.period->startDate;
        }
        return a.entry->date < b.entry->date;
    });

    std::ostringstream out;
    out << TITLE << "\n";
    out << "Generated: " << generatedAt.toString() << "\n";
    out << rateConfig.describe() << "\n";
    out << std::string(SEPARATOR_WIDTH, '=') << "\n";
    out << HEADER << "\n";

    for (const auto& row : rows) {
        out << row.period->startDate.toString() << ","
            << row.entry->date.toString() << ","
            << formatHours(row.entry->hours) << ","
            << escapeField(row.entry->note) << ","
            << row.entry->loggedAt.toString() << "\n";
    }

    return out.str();
}

std::string ExportFormatter::formatHours(double hours) {
    std::ostringstream ss;
    ss << hours;
    return ss.str();
}

std::string ExportFormatter::escapeField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }

    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

} // namespace ledgerflow::application
