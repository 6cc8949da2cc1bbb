#pragma once

#include "common/namespace.hpp"

#include <string>

BEGIN_NAMESPACE(strandcheck)

double const DEFAULT_SIGNIFICANCE_LEVEL = 0.05;

// Conventional magnitude labels for the effect sizes in a StatisticsReport.
std::string cohens_h_magnitude(double h);
std::string cramers_v_magnitude(double v);

// Evidence for a skewed split given the likelihood ratio against 50/50.
std::string bayes_factor_evidence(double bf);

bool significant(double p_value, double alpha = DEFAULT_SIGNIFICANCE_LEVEL);

END_NAMESPACE(strandcheck)
