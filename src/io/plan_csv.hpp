// src/io/plan_csv.hpp
#pragma once

#include "plan/operating_plan.hpp"

#include <string>

namespace io {

/**
 * PlanCsv - Plan serialization for review and hand-off
 *
 * One row per hour, columns in all_plan_fields() order, timestamps as
 * ISO-8601 UTC, null values as empty cells.
 *
 * read() records which known columns the file carried so an incomplete
 * file is reported by the validator (MISSING_FIELDS / NULL_VALUES)
 * instead of failing here. Unknown columns are ignored.
 */
class PlanCsv {
public:
    /**
     * @return false if the file could not be written
     */
    static bool write(const plan::OperatingPlan& plan, const std::string& csv_path);

    /**
     * @throws std::runtime_error if the file cannot be opened or a
     *         non-empty cell cannot be parsed
     */
    static plan::OperatingPlan read(const std::string& csv_path);
};

} // namespace io
