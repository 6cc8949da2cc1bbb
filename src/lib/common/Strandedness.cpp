#include "Strandedness.hpp"

BEGIN_NAMESPACE(strandcheck)

StrandednessNames::StrandednessNames() {
    strings_[INSUFFICIENT_DATA] = "insufficient-data";
    strings_[FR_UNSTRANDED] = "fr-unstranded";
    strings_[FR_FIRSTSTRAND] = "fr-firststrand";
    strings_[FR_SECONDSTRAND] = "fr-secondstrand";
}

const StrandednessNames STRANDEDNESS_NAMES;

END_NAMESPACE(strandcheck)
