#include "CountSnapshot.hpp"

#include <boost/format.hpp>

#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(strandcheck)

CountSnapshot::CountSnapshot()
    : total(0)
    , fwd(0)
    , rev(0)
    , unmapped(0)
    , secondary(0)
    , supplementary(0)
    , low_mapq(0)
{
}

int64_t CountSnapshot::count(AlignmentCategory cat) const {
    switch (cat) {
        case FWD_PRIMARY: return fwd;
        case REV_PRIMARY: return rev;
        case UNMAPPED: return unmapped;
        case SECONDARY: return secondary;
        case SUPPLEMENTARY: return supplementary;
        case LOW_MAPQ: return low_mapq;
        default: break;
    }
    throw std::invalid_argument(str(format("Invalid alignment category %1%") % int(cat)));
}

void CountSnapshot::validate() const {
    if (total < 0) {
        throw std::invalid_argument(str(format(
            "Invalid counts%1%: negative total (%2%)")
            % (label.empty() ? "" : " for " + label) % total));
    }

    int64_t bucket_sum = 0;
    for (int i = 0; i < int(NUM_ALIGNMENT_CATEGORIES); ++i) {
        AlignmentCategory cat = AlignmentCategory(i);
        int64_t n = count(cat);
        if (n < 0) {
            throw std::invalid_argument(str(format(
                "Invalid counts%1%: negative %2% count (%3%)")
                % (label.empty() ? "" : " for " + label)
                % CATEGORY_NAMES[cat] % n));
        }
        bucket_sum += n;
    }

    if (informative() > total) {
        throw std::invalid_argument(str(format(
            "Invalid counts%1%: forward (%2%) + reverse (%3%) exceeds total (%4%)")
            % (label.empty() ? "" : " for " + label) % fwd % rev % total));
    }

    if (bucket_sum > total) {
        throw std::invalid_argument(str(format(
            "Invalid counts%1%: categorized reads (%2%) exceed total (%3%)")
            % (label.empty() ? "" : " for " + label) % bucket_sum % total));
    }
}

bool CountSnapshot::operator==(CountSnapshot const& rhs) const {
    return total == rhs.total
        && fwd == rhs.fwd
        && rev == rhs.rev
        && unmapped == rhs.unmapped
        && secondary == rhs.secondary
        && supplementary == rhs.supplementary
        && low_mapq == rhs.low_mapq
        && label == rhs.label
        ;
}

bool CountSnapshot::operator!=(CountSnapshot const& rhs) const {
    return !(*this == rhs);
}

std::ostream& operator<<(std::ostream& os, CountSnapshot const& snap) {
    os << "total:" << snap.total
        << " fwd:" << snap.fwd
        << " rev:" << snap.rev
        << " unmapped:" << snap.unmapped
        << " secondary:" << snap.secondary
        << " supplementary:" << snap.supplementary
        << " low_mapq:" << snap.low_mapq;
    if (snap.has_label())
        os << " label:" << snap.label;
    return os;
}

END_NAMESPACE(strandcheck)
