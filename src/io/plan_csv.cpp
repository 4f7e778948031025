// src/io/plan_csv.cpp
#include "io/plan_csv.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <stdexcept>
#include <vector>

namespace io {

namespace {

std::string cell_for(const plan::OperatingPlan& cop, const plan::PlanHour& h, plan::PlanField field) {
    using plan::PlanField;
    using utils::CsvWriter;

    switch (field) {
        case PlanField::HourEnding:
            return h.hour_ending ? utils::format_iso8601_utc(*h.hour_ending) : "";
        case PlanField::ResourceName:      return cop.resource_name;
        case PlanField::Status:            return h.status ? resource::to_string(*h.status) : "";
        case PlanField::Hsl:               return CsvWriter::format_double(h.hsl);
        case PlanField::Lsl:               return CsvWriter::format_double(h.lsl);
        case PlanField::Hel:               return CsvWriter::format_double(h.hel);
        case PlanField::Lel:               return CsvWriter::format_double(h.lel);
        case PlanField::NormalRampUp:      return CsvWriter::format_double(h.normal_ramp_up);
        case PlanField::NormalRampDown:    return CsvWriter::format_double(h.normal_ramp_down);
        case PlanField::EmergencyRampUp:   return CsvWriter::format_double(h.emergency_ramp_up);
        case PlanField::EmergencyRampDown: return CsvWriter::format_double(h.emergency_ramp_down);
        case PlanField::SocBegin:          return CsvWriter::format_double(h.soc_begin_mwh);
        case PlanField::SocMin:            return CsvWriter::format_double(h.soc_min_mwh);
        case PlanField::SocMax:            return CsvWriter::format_double(h.soc_max_mwh);
        case PlanField::TargetMw:          return CsvWriter::format_double(h.target_mw);
        case PlanField::Mode:              return plan::to_string(h.mode);
        case PlanField::AuxLoad:           return CsvWriter::format_double(h.aux_load_mw);
    }
    return "";
}

void parse_cell(plan::OperatingPlan& cop, plan::PlanHour& h, plan::PlanField field,
                const std::string& text) {
    using plan::PlanField;
    using utils::CsvReader;

    switch (field) {
        case PlanField::HourEnding:
            if (!text.empty()) {
                h.hour_ending = utils::parse_iso8601_utc(text);
                if (!h.hour_ending) {
                    throw std::runtime_error("invalid hour_ending '" + text + "'");
                }
            }
            break;
        case PlanField::ResourceName:
            if (cop.resource_name.empty()) {
                cop.resource_name = text;
            }
            break;
        case PlanField::Status:
            if (!text.empty()) {
                h.status = resource::status_from_string(text);
                if (!h.status) {
                    throw std::runtime_error("unknown status '" + text + "'");
                }
            }
            break;
        case PlanField::Mode:
            if (!text.empty()) {
                const auto mode = plan::mode_from_string(text);
                if (!mode) {
                    throw std::runtime_error("unknown mode '" + text + "'");
                }
                h.mode = *mode;
            }
            break;
        case PlanField::Hsl:               h.hsl = CsvReader::to_nullable_double(text); break;
        case PlanField::Lsl:               h.lsl = CsvReader::to_nullable_double(text); break;
        case PlanField::Hel:               h.hel = CsvReader::to_nullable_double(text); break;
        case PlanField::Lel:               h.lel = CsvReader::to_nullable_double(text); break;
        case PlanField::NormalRampUp:      h.normal_ramp_up = CsvReader::to_nullable_double(text); break;
        case PlanField::NormalRampDown:    h.normal_ramp_down = CsvReader::to_nullable_double(text); break;
        case PlanField::EmergencyRampUp:   h.emergency_ramp_up = CsvReader::to_nullable_double(text); break;
        case PlanField::EmergencyRampDown: h.emergency_ramp_down = CsvReader::to_nullable_double(text); break;
        case PlanField::SocBegin:          h.soc_begin_mwh = CsvReader::to_nullable_double(text); break;
        case PlanField::SocMin:            h.soc_min_mwh = CsvReader::to_nullable_double(text); break;
        case PlanField::SocMax:            h.soc_max_mwh = CsvReader::to_nullable_double(text); break;
        case PlanField::TargetMw:          h.target_mw = CsvReader::to_nullable_double(text); break;
        case PlanField::AuxLoad:           h.aux_load_mw = CsvReader::to_nullable_double(text); break;
    }
}

} // namespace

bool PlanCsv::write(const plan::OperatingPlan& cop, const std::string& csv_path) {
    utils::CsvWriter csv;
    if (!csv.open(csv_path)) {
        LOG_ERROR("[PlanCsv] Failed to open for writing: %s", csv_path.c_str());
        return false;
    }

    const auto& fields = plan::all_plan_fields();

    std::vector<std::string> cells;
    cells.reserve(fields.size());
    for (auto f : fields) {
        cells.push_back(plan::field_name(f));
    }
    csv.write_row(cells);

    for (const auto& h : cop.hours) {
        cells.clear();
        for (auto f : fields) {
            cells.push_back(cop.has_field(f) ? cell_for(cop, h, f) : "");
        }
        csv.write_row(cells);
    }

    const bool ok = csv.good();
    csv.close();

    if (ok) {
        LOG_INFO("[PlanCsv] Wrote %zu hours to %s", cop.size(), csv_path.c_str());
    } else {
        LOG_ERROR("[PlanCsv] Write failed: %s", csv_path.c_str());
    }
    return ok;
}

plan::OperatingPlan PlanCsv::read(const std::string& csv_path) {
    utils::CsvReader csv;
    if (!csv.open(csv_path)) {
        throw std::runtime_error("[PlanCsv] Failed to open: " + csv_path);
    }

    plan::OperatingPlan cop;

    std::vector<plan::PlanField> columns;
    for (const auto& name : csv.header()) {
        const auto field = plan::field_from_name(name);
        if (field) {
            columns.push_back(*field);
            cop.fields.insert(*field);
        } else {
            LOG_DEBUG("[PlanCsv] Ignoring unknown column '%s'", name.c_str());
        }
    }

    std::vector<std::string> row;
    size_t line = 0;
    while (csv.read_row(row)) {
        ++line;
        plan::PlanHour h;
        for (auto f : columns) {
            try {
                parse_cell(cop, h, f, csv.get(row, plan::field_name(f)));
            } catch (const std::exception& e) {
                throw std::runtime_error("[PlanCsv] " + csv_path + " row " + std::to_string(line) +
                                         ", column " + plan::field_name(f) + ": " + e.what());
            }
        }
        cop.hours.push_back(h);
    }

    LOG_INFO("[PlanCsv] Read %zu hours (%zu known columns) from %s",
             cop.size(), columns.size(), csv_path.c_str());
    return cop;
}

} // namespace io
