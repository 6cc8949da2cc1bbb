#include "AlignmentCategory.hpp"

BEGIN_NAMESPACE(strandcheck)

CategoryNames::CategoryNames() {
    strings_[FWD_PRIMARY] = "forward_primary";
    strings_[REV_PRIMARY] = "reverse_primary";
    strings_[UNMAPPED] = "unmapped";
    strings_[SECONDARY] = "secondary";
    strings_[SUPPLEMENTARY] = "supplementary";
    strings_[LOW_MAPQ] = "low_mapq";
}

const CategoryNames CATEGORY_NAMES;

END_NAMESPACE(strandcheck)
