#pragma once

#include "common/Strandedness.hpp"
#include "common/namespace.hpp"

#include <limits>
#include <stdint.h>

BEGIN_NAMESPACE(strandcheck)

// Stands in for statistics whose exact value is infinite (F2R_Ratio with no
// reverse reads, Rel_Diff with an empty strand, an overflowing Bayes factor).
double const UNBOUNDED = std::numeric_limits<double>::max();

inline
bool is_unbounded(double x) {
    return x >= UNBOUNDED || x <= -UNBOUNDED;
}

struct StatisticsReport {
    StatisticsReport()
        : fwd(0)
        , rev(0)
        , total(0)
        , fwd_ratio(0.0)
        , rev_ratio(0.0)
        , f2r_ratio(0.0)
        , log2_f2r(0.0)
        , rel_diff(0.0)
        , chi2(0.0)
        , p_value(1.0)
        , cohens_h(0.0)
        , cramers_v(0.0)
        , bayes_factor(1.0)
        , log10_bayes_factor(0.0)
        , epsilon(0.0)
        , hellinger(0.0)
        , entropy(0.0)
        , strandedness(INSUFFICIENT_DATA)
    {}

    int64_t fwd;
    int64_t rev;
    int64_t total;

    double fwd_ratio;
    double rev_ratio;
    double f2r_ratio;
    double log2_f2r;
    double rel_diff;
    double chi2;
    double p_value;
    double cohens_h;
    double cramers_v;
    double bayes_factor;
    // Finite even where bayes_factor saturates at UNBOUNDED.
    double log10_bayes_factor;
    double epsilon;
    double hellinger;
    double entropy;

    Strandedness strandedness;
};

END_NAMESPACE(strandcheck)
