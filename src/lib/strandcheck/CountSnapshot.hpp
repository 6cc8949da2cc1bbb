#pragma once

#include "common/AlignmentCategory.hpp"
#include "common/namespace.hpp"

#include <ostream>
#include <stdint.h>
#include <string>

BEGIN_NAMESPACE(strandcheck)

// Cumulative alignment counts for a sample, or for the first N reads of it
// when produced by incremental extraction.
struct CountSnapshot {
    CountSnapshot();

    int64_t informative() const { return fwd + rev; }
    int64_t count(AlignmentCategory cat) const;
    bool has_label() const { return !label.empty(); }

    // Throws std::invalid_argument when counts are negative or the buckets
    // add up to more than total.
    void validate() const;

    bool operator==(CountSnapshot const& rhs) const;
    bool operator!=(CountSnapshot const& rhs) const;

    int64_t total;
    int64_t fwd;
    int64_t rev;
    int64_t unmapped;
    int64_t secondary;
    int64_t supplementary;
    int64_t low_mapq;
    std::string label;
};

std::ostream& operator<<(std::ostream& os, CountSnapshot const& snap);

END_NAMESPACE(strandcheck)
