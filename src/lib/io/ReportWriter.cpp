#include "ReportWriter.hpp"

#include "strandcheck/Interpretation.hpp"

#include <boost/format.hpp>

#include <string>

using boost::format;

BEGIN_NAMESPACE(strandcheck)

std::string const UNBOUNDED_TEXT("Unbounded");

namespace {
    char const* const HEADER[] = {
          "File"
        , "Strandedness"
        , "Fwd"
        , "Rev"
        , "Total"
        , "Fwd_Ratio"
        , "Rev_Ratio"
        , "F2R_Ratio"
        , "Log2_F2R"
        , "Rel_Diff"
        , "Chi2"
        , "P_value"
        , "Cohens_h"
        , "Cramers_V"
        , "Bayes_Factor"
        , "Epsilon"
        , "Hellinger"
        , "Entropy"
    };

    std::string const RULE(60, '=');
}

std::string report_file_column(std::string const& name, std::string const& label) {
    if (label.empty())
        return name;
    return name + "[" + label + "]";
}

std::string format_fixed(double x) {
    if (is_unbounded(x))
        return UNBOUNDED_TEXT;
    return str(format("%.6f") % x);
}

std::string format_scientific(double x) {
    if (is_unbounded(x))
        return UNBOUNDED_TEXT;
    return str(format("%.6e") % x);
}

void write_report_header(std::ostream& out) {
    std::size_t const n = sizeof(HEADER) / sizeof(HEADER[0]);
    out << HEADER[0];
    for (std::size_t i = 1; i < n; ++i)
        out << "\t" << HEADER[i];
    out << "\n";
}

void write_report_row(std::ostream& out, ReportRow const& row) {
    StatisticsReport const& s = row.stats;
    out << row.file
        << "\t" << s.strandedness
        << "\t" << s.fwd
        << "\t" << s.rev
        << "\t" << s.total
        << "\t" << format_fixed(s.fwd_ratio)
        << "\t" << format_fixed(s.rev_ratio)
        << "\t" << format_fixed(s.f2r_ratio)
        << "\t" << format_fixed(s.log2_f2r)
        << "\t" << format_fixed(s.rel_diff)
        << "\t" << format_fixed(s.chi2)
        << "\t" << format_scientific(s.p_value)
        << "\t" << format_fixed(s.cohens_h)
        << "\t" << format_fixed(s.cramers_v)
        << "\t" << format_scientific(s.bayes_factor)
        << "\t" << format_fixed(s.epsilon)
        << "\t" << format_fixed(s.hellinger)
        << "\t" << format_fixed(s.entropy)
        << "\n";
}

void write_report(std::ostream& out, std::vector<ReportRow> const& rows) {
    write_report_header(out);
    for (std::size_t i = 0; i < rows.size(); ++i)
        write_report_row(out, rows[i]);
}

void write_detailed_report(std::ostream& out, ReportRow const& row) {
    StatisticsReport const& s = row.stats;

    out << RULE << "\n"
        << "Strand preference analysis report: " << row.file << "\n"
        << RULE << "\n";

    out << "\n[Basic Statistics]\n"
        << "  Forward strand: " << s.fwd << "\n"
        << "  Reverse strand: " << s.rev << "\n"
        << "  Total         : " << s.total << "\n";

    out << "\n[Proportion Statistics]\n"
        << format("  Forward ratio: %.4f (%.2f%%)\n") % s.fwd_ratio % (s.fwd_ratio * 100.0)
        << format("  Reverse ratio: %.4f (%.2f%%)\n") % s.rev_ratio % (s.rev_ratio * 100.0)
        << "  F/R ratio: " << format_fixed(s.f2r_ratio) << "\n"
        << "  Log2(F/R): " << format_fixed(s.log2_f2r) << "\n"
        << "  Relative difference: " << format_fixed(s.rel_diff) << "\n";

    out << "\n[Chi-square Test]\n"
        << format("  Chi-square value: %.4f\n") % s.chi2
        << format("  P-value: %.4e\n") % s.p_value;
    if (significant(s.p_value)) {
        out << format("  Conclusion: P < %1%, distribution significantly non-uniform\n")
            % DEFAULT_SIGNIFICANCE_LEVEL;
    }
    else {
        out << format("  Conclusion: P >= %1%, uniform distribution\n")
            % DEFAULT_SIGNIFICANCE_LEVEL;
    }

    out << "\n[Effect Size]\n"
        << format("  Cohen's h: %.4f (%s)\n") % s.cohens_h % cohens_h_magnitude(s.cohens_h)
        << format("  Cramer's V: %.4f (%s)\n") % s.cramers_v % cramers_v_magnitude(s.cramers_v)
        << format("  Epsilon: %.4f\n") % s.epsilon
        << format("  Hellinger distance: %.4f\n") % s.hellinger
        << format("  Entropy: %.4f bits\n") % s.entropy;

    out << "\n[Bayesian Analysis]\n"
        << "  Bayes factor (skewed vs 50/50): " << format_scientific(s.bayes_factor) << "\n"
        << format("  log10 Bayes factor: %.4f\n") % s.log10_bayes_factor
        << "  Evidence for strand skew: " << bayes_factor_evidence(s.bayes_factor) << "\n";

    out << "\n[Strandedness]\n"
        << "  Type: " << s.strandedness << "\n";

    out << "\n" << RULE << "\n";
}

END_NAMESPACE(strandcheck)
