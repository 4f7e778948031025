// src/io/forecast_csv.hpp
#pragma once

#include "plan/ancillary_commitment_applier.hpp"
#include "plan/operating_plan_generator.hpp"

#include <string>

namespace io {

/**
 * load_price_forecast() - Read hour_ending,price rows
 *
 * hour_ending is ISO-8601 UTC. Rows with an empty price are skipped
 * (those hours fall back to the neutral price). A duplicate hour keeps
 * the last row.
 *
 * @throws std::runtime_error if the file cannot be opened, a required
 *         column is missing or a cell cannot be parsed
 */
plan::PriceForecast load_price_forecast(const std::string& csv_path);

/**
 * load_as_commitments() - Read hour_ending,regulation,rrs,ecrs rows
 *
 * Only hour_ending is required; absent product columns and empty cells
 * read as 0 MW.
 *
 * @throws std::runtime_error on open/parse errors
 */
plan::CommitmentSchedule load_as_commitments(const std::string& csv_path);

} // namespace io
