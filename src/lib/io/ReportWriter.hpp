#pragma once

#include "common/namespace.hpp"
#include "strandcheck/StatisticsReport.hpp"

#include <ostream>
#include <string>
#include <vector>

BEGIN_NAMESPACE(strandcheck)

struct ReportRow {
    ReportRow() {}
    ReportRow(std::string const& file, StatisticsReport const& stats)
        : file(file)
        , stats(stats)
    {}

    std::string file;
    StatisticsReport stats;
};

extern std::string const UNBOUNDED_TEXT;

// "name" for whole-sample rows, "name[label]" for incremental block rows.
std::string report_file_column(std::string const& name, std::string const& label);

std::string format_fixed(double x);
std::string format_scientific(double x);

void write_report_header(std::ostream& out);
void write_report_row(std::ostream& out, ReportRow const& row);
void write_report(std::ostream& out, std::vector<ReportRow> const& rows);

// Human readable breakdown of one row with effect size interpretations.
void write_detailed_report(std::ostream& out, ReportRow const& row);

END_NAMESPACE(strandcheck)
