#include "Interpretation.hpp"

#include <cmath>

BEGIN_NAMESPACE(strandcheck)

std::string cohens_h_magnitude(double h) {
    double const a = std::fabs(h);
    if (a < 0.2)
        return "small";
    if (a < 0.5)
        return "medium";
    if (a < 0.8)
        return "large";
    return "very large";
}

std::string cramers_v_magnitude(double v) {
    if (v < 0.1)
        return "negligible";
    if (v < 0.3)
        return "small";
    if (v < 0.5)
        return "medium";
    return "large";
}

std::string bayes_factor_evidence(double bf) {
    if (bf > 100.0)
        return "extreme";
    if (bf > 30.0)
        return "very strong";
    if (bf > 10.0)
        return "strong";
    if (bf > 3.0)
        return "moderate";
    if (bf > 1.0)
        return "weak";
    return "none";
}

bool significant(double p_value, double alpha) {
    return p_value < alpha;
}

END_NAMESPACE(strandcheck)
