#pragma once

#include "CountSnapshot.hpp"
#include "StatisticsReport.hpp"

#include "common/Strandedness.hpp"
#include "common/namespace.hpp"

#include <stdint.h>

BEGIN_NAMESPACE(strandcheck)

struct ClassifierConfig {
    ClassifierConfig();

    // Samples with fwd + rev <= min_total are insufficient-data.
    int64_t min_total;
    // Samples with Rel_Diff <= max_unstranded_rel_diff are fr-unstranded.
    double max_unstranded_rel_diff;
};

// All statistics for a forward/reverse split. The strandedness field is left
// at INSUFFICIENT_DATA; see decide_strandedness. Throws std::invalid_argument
// for negative counts.
StatisticsReport compute_statistics(int64_t fwd, int64_t rev);

// Three tiers, evaluated in order: sample size, then Rel_Diff, then the
// direction of F2R_Ratio.
Strandedness decide_strandedness(
      int64_t total
    , double rel_diff
    , double f2r_ratio
    , ClassifierConfig const& cfg = ClassifierConfig()
    );

class StrandClassifier {
public:
    explicit StrandClassifier(ClassifierConfig const& cfg = ClassifierConfig());

    ClassifierConfig const& config() const;

    // Throws std::invalid_argument if snap fails validation.
    StatisticsReport classify(CountSnapshot const& snap) const;

    // True once snap supports a strand call (anything but insufficient-data).
    bool decided(CountSnapshot const& snap) const;

private:
    ClassifierConfig cfg_;
};

END_NAMESPACE(strandcheck)
