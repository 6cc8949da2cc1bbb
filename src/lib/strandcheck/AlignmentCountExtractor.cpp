#include "AlignmentCountExtractor.hpp"

#include "common/utility.hpp"

#include <boost/format.hpp>

#include <stdexcept>

BEGIN_NAMESPACE(strandcheck)

ExtractorConfig::ExtractorConfig()
    : min_mapq(20)
    , block_size(1000000)
    , max_blocks(8)
{
}

AlignmentCategory categorize(AlignmentRecord const& rec, int min_mapq) {
    if (rec.unmapped())
        return UNMAPPED;
    if (rec.secondary())
        return SECONDARY;
    if (rec.supplementary())
        return SUPPLEMENTARY;
    if (min_mapq >= 0 && rec.mapq <= min_mapq)
        return LOW_MAPQ;

    return rec.reversed() ? REV_PRIMARY : FWD_PRIMARY;
}

std::string block_label(std::size_t block_index, std::size_t block_size) {
    return compact_count(block_index * block_size);
}

std::string partial_block_label(std::size_t blocks_done, std::size_t block_size) {
    return block_label(blocks_done + 1, block_size) + "_partial";
}

CountAccumulator::CountAccumulator() {
}

void CountAccumulator::observe(AlignmentCategory cat) {
    ++counts_.total;
    switch (cat) {
        case FWD_PRIMARY: ++counts_.fwd; break;
        case REV_PRIMARY: ++counts_.rev; break;
        case UNMAPPED: ++counts_.unmapped; break;
        case SECONDARY: ++counts_.secondary; break;
        case SUPPLEMENTARY: ++counts_.supplementary; break;
        case LOW_MAPQ: ++counts_.low_mapq; break;
        default:
            throw std::invalid_argument(str(boost::format(
                "Invalid alignment category %1%") % int(cat)));
    }
}

int64_t CountAccumulator::total() const {
    return counts_.total;
}

CountSnapshot CountAccumulator::snapshot(std::string const& label) const {
    CountSnapshot rv(counts_);
    rv.label = label;
    return rv;
}

AlignmentCountExtractor::AlignmentCountExtractor(ExtractorConfig const& cfg)
    : cfg_(cfg)
{
    if (cfg_.block_size == 0) {
        throw std::invalid_argument("Block size must be positive");
    }
}

ExtractorConfig const& AlignmentCountExtractor::config() const {
    return cfg_;
}

CountSnapshot AlignmentCountExtractor::count_all(IAlignmentRecordSource& src) const {
    CountAccumulator acc;
    AlignmentRecord rec;
    while (src.next(rec))
        acc.observe(categorize(rec, cfg_.min_mapq));
    return acc.snapshot();
}

std::size_t AlignmentCountExtractor::count_blocks(
          IAlignmentRecordSource& src
        , SnapshotVisitor const& visit
        ) const
{
    CountAccumulator acc;
    AlignmentRecord rec;
    std::size_t blocks = 0;
    std::size_t const block_size = cfg_.block_size;
    bool const limited = cfg_.max_blocks > 0;

    while ((!limited || blocks < cfg_.max_blocks) && src.next(rec)) {
        acc.observe(categorize(rec, cfg_.min_mapq));
        if (std::size_t(acc.total()) % block_size == 0) {
            ++blocks;
            if (!visit(acc.snapshot(block_label(blocks, block_size))))
                return blocks;
        }
    }

    if ((!limited || blocks < cfg_.max_blocks)
        && std::size_t(acc.total()) % block_size != 0)
    {
        visit(acc.snapshot(partial_block_label(blocks, block_size)));
        ++blocks;
    }

    return blocks;
}

namespace {
    struct SnapshotCollector {
        explicit SnapshotCollector(std::vector<CountSnapshot>& out)
            : out(out)
        {}

        bool operator()(CountSnapshot const& snap) const {
            out.push_back(snap);
            return true;
        }

        std::vector<CountSnapshot>& out;
    };
}

std::vector<CountSnapshot> AlignmentCountExtractor::count_blocks(
        IAlignmentRecordSource& src) const
{
    std::vector<CountSnapshot> rv;
    count_blocks(src, SnapshotCollector(rv));
    return rv;
}

END_NAMESPACE(strandcheck)
