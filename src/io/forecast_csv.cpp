// src/io/forecast_csv.cpp
#include "io/forecast_csv.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <stdexcept>
#include <vector>

namespace io {

namespace {

std::time_t parse_hour(const std::string& text, const std::string& path, size_t line) {
    const auto t = utils::parse_iso8601_utc(text);
    if (!t) {
        throw std::runtime_error("[ForecastCsv] " + path + " row " + std::to_string(line) +
                                 ": invalid hour_ending '" + text + "'");
    }
    return *t;
}

double parse_number(const std::string& text, const char* column,
                    const std::string& path, size_t line) {
    try {
        return utils::CsvReader::to_double(text, 0.0);
    } catch (const std::exception&) {
        throw std::runtime_error("[ForecastCsv] " + path + " row " + std::to_string(line) +
                                 ": invalid " + column + " '" + text + "'");
    }
}

void open_or_throw(utils::CsvReader& csv, const std::string& path) {
    if (!csv.open(path)) {
        throw std::runtime_error("[ForecastCsv] Failed to open: " + path);
    }
    if (!csv.has_col("hour_ending")) {
        throw std::runtime_error("[ForecastCsv] " + path + ": missing column 'hour_ending'");
    }
}

} // namespace

plan::PriceForecast load_price_forecast(const std::string& csv_path) {
    utils::CsvReader csv;
    open_or_throw(csv, csv_path);
    if (!csv.has_col("price")) {
        throw std::runtime_error("[ForecastCsv] " + csv_path + ": missing column 'price'");
    }

    plan::PriceForecast forecast;
    std::vector<std::string> row;
    size_t line = 0;

    while (csv.read_row(row)) {
        ++line;
        const std::string price_text = csv.get(row, "price");
        if (price_text.empty()) {
            continue;
        }
        const std::time_t t = parse_hour(csv.get(row, "hour_ending"), csv_path, line);
        forecast[t] = parse_number(price_text, "price", csv_path, line);
    }

    LOG_INFO("[ForecastCsv] Loaded %zu price points from %s", forecast.size(), csv_path.c_str());
    return forecast;
}

plan::CommitmentSchedule load_as_commitments(const std::string& csv_path) {
    utils::CsvReader csv;
    open_or_throw(csv, csv_path);

    plan::CommitmentSchedule schedule;
    std::vector<std::string> row;
    size_t line = 0;

    while (csv.read_row(row)) {
        ++line;
        const std::time_t t = parse_hour(csv.get(row, "hour_ending"), csv_path, line);

        plan::AsCommitment c;
        c.regulation_mw = parse_number(csv.get(row, "regulation"), "regulation", csv_path, line);
        c.rrs_mw = parse_number(csv.get(row, "rrs"), "rrs", csv_path, line);
        c.ecrs_mw = parse_number(csv.get(row, "ecrs"), "ecrs", csv_path, line);
        schedule[t] = c;
    }

    LOG_INFO("[ForecastCsv] Loaded %zu AS commitment hours from %s", schedule.size(), csv_path.c_str());
    return schedule;
}

} // namespace io
