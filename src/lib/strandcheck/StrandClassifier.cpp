#include "StrandClassifier.hpp"

#include <boost/format.hpp>
#include <boost/math/distributions/chi_squared.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

BEGIN_NAMESPACE(strandcheck)

namespace {
    double const LOG2_PSEUDO_COUNT = 0.5;

    double chi2_upper_tail(double chi2) {
        boost::math::chi_squared_distribution<double> dist(1.0);
        return boost::math::cdf(boost::math::complement(dist, chi2));
    }

    // Natural log of the likelihood ratio of the observed binomial
    // proportion against p = 0.5. Zero-count terms contribute nothing.
    double log_bayes_factor(int64_t fwd, int64_t rev, double p, double q) {
        double log_bf = 0.0;
        if (fwd > 0)
            log_bf += fwd * std::log(2.0 * p);
        if (rev > 0)
            log_bf += rev * std::log(2.0 * q);
        return log_bf;
    }

    double entropy_term(double x) {
        return x > 0.0 ? -x * std::log2(x) : 0.0;
    }
}

ClassifierConfig::ClassifierConfig()
    : min_total(3000)
    , max_unstranded_rel_diff(1.0)
{
}

StatisticsReport compute_statistics(int64_t fwd, int64_t rev) {
    if (fwd < 0 || rev < 0) {
        throw std::invalid_argument(str(boost::format(
            "Invalid strand counts: forward (%1%) and reverse (%2%) must not be negative")
            % fwd % rev));
    }

    StatisticsReport rv;
    rv.fwd = fwd;
    rv.rev = rev;
    rv.total = fwd + rev;

    // Defaults already describe an empty sample.
    if (rv.total == 0)
        return rv;

    double const t = double(rv.total);
    double const p = fwd / t;
    double const q = rev / t;
    int64_t const smaller = std::min(fwd, rev);

    rv.fwd_ratio = p;
    rv.rev_ratio = q;

    rv.f2r_ratio = rev > 0 ? double(fwd) / rev : UNBOUNDED;

    if (fwd > 0 && rev > 0) {
        rv.log2_f2r = std::log2(rv.f2r_ratio);
    }
    else {
        rv.log2_f2r = std::log2(
            (fwd + LOG2_PSEUDO_COUNT) / (rev + LOG2_PSEUDO_COUNT));
    }

    rv.rel_diff = smaller > 0
        ? double(std::llabs(fwd - rev)) / smaller
        : UNBOUNDED;

    double const expected = t / 2.0;
    rv.chi2 = (fwd - expected) * (fwd - expected) / expected
        + (rev - expected) * (rev - expected) / expected;
    rv.p_value = chi2_upper_tail(rv.chi2);

    rv.cohens_h = 2.0 * std::asin(std::sqrt(p)) - 2.0 * std::asin(std::sqrt(q));
    rv.cramers_v = std::sqrt(rv.chi2 / t);
    double const log_bf = log_bayes_factor(fwd, rev, p, q);
    rv.log10_bayes_factor = log_bf / std::log(10.0);
    rv.bayes_factor = log_bf >= std::log(UNBOUNDED) ? UNBOUNDED : std::exp(log_bf);
    rv.epsilon = std::fabs(p - 0.5);

    double const sqrt_half = std::sqrt(0.5);
    double const dp = std::sqrt(p) - sqrt_half;
    double const dq = std::sqrt(q) - sqrt_half;
    rv.hellinger = std::sqrt(dp * dp + dq * dq) / std::sqrt(2.0);

    rv.entropy = entropy_term(p) + entropy_term(q);

    return rv;
}

Strandedness decide_strandedness(
          int64_t total
        , double rel_diff
        , double f2r_ratio
        , ClassifierConfig const& cfg
        )
{
    if (total <= cfg.min_total)
        return INSUFFICIENT_DATA;

    if (rel_diff <= cfg.max_unstranded_rel_diff)
        return FR_UNSTRANDED;

    if (f2r_ratio > 1.0)
        return FR_FIRSTSTRAND;

    return FR_SECONDSTRAND;
}

StrandClassifier::StrandClassifier(ClassifierConfig const& cfg)
    : cfg_(cfg)
{
}

ClassifierConfig const& StrandClassifier::config() const {
    return cfg_;
}

StatisticsReport StrandClassifier::classify(CountSnapshot const& snap) const {
    snap.validate();

    StatisticsReport rv = compute_statistics(snap.fwd, snap.rev);
    if (rv.total == 0)
        return rv;

    rv.strandedness = decide_strandedness(rv.total, rv.rel_diff, rv.f2r_ratio, cfg_);
    return rv;
}

bool StrandClassifier::decided(CountSnapshot const& snap) const {
    return classify(snap).strandedness != INSUFFICIENT_DATA;
}

END_NAMESPACE(strandcheck)
