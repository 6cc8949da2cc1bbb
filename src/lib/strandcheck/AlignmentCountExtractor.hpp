#pragma once

#include "CountSnapshot.hpp"

#include "common/AlignmentCategory.hpp"
#include "common/AlignmentRecord.hpp"
#include "common/IAlignmentRecordSource.hpp"
#include "common/namespace.hpp"

#include <boost/function.hpp>

#include <cstddef>
#include <string>
#include <vector>

BEGIN_NAMESPACE(strandcheck)

struct ExtractorConfig {
    ExtractorConfig();

    // Primary alignments with MAPQ <= min_mapq are counted as LOW_MAPQ
    // instead of contributing a strand. A negative value disables the filter.
    int min_mapq;
    std::size_t block_size;
    // Upper bound on the number of snapshots in incremental mode, 0 for none.
    std::size_t max_blocks;
};

// Classification precedence: unmapped, secondary, supplementary, low mapq,
// then strand. The first matching bucket wins.
AlignmentCategory categorize(AlignmentRecord const& rec, int min_mapq);

std::string block_label(std::size_t block_index, std::size_t block_size);
std::string partial_block_label(std::size_t blocks_done, std::size_t block_size);

class CountAccumulator {
public:
    CountAccumulator();

    void observe(AlignmentCategory cat);

    int64_t total() const;
    CountSnapshot snapshot(std::string const& label = "") const;

private:
    CountSnapshot counts_;
};

class AlignmentCountExtractor {
public:
    // Receives each cumulative snapshot; returning false ends the pass.
    typedef boost::function<bool (CountSnapshot const&)> SnapshotVisitor;

    explicit AlignmentCountExtractor(ExtractorConfig const& cfg = ExtractorConfig());

    ExtractorConfig const& config() const;

    // Single pass over the whole input.
    CountSnapshot count_all(IAlignmentRecordSource& src) const;

    // Incremental pass. Emits a snapshot at every block_size reads until the
    // block budget is spent, plus a final partial snapshot if the input ends
    // between boundaries with budget remaining. Returns the number of
    // snapshots handed to visit.
    std::size_t count_blocks(
          IAlignmentRecordSource& src
        , SnapshotVisitor const& visit
        ) const;

    std::vector<CountSnapshot> count_blocks(IAlignmentRecordSource& src) const;

private:
    ExtractorConfig cfg_;
};

END_NAMESPACE(strandcheck)
