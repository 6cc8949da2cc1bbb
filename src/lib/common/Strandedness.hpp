#pragma once

#include "common/namespace.hpp"

#include <boost/array.hpp>

#include <ostream>
#include <string>

BEGIN_NAMESPACE(strandcheck)

enum Strandedness {
    INSUFFICIENT_DATA = 0,
    FR_UNSTRANDED,
    FR_FIRSTSTRAND,
    FR_SECONDSTRAND,
    NUM_STRANDEDNESS
};

struct StrandednessNames {
    StrandednessNames();

    std::string const& operator[](Strandedness s) const;

private:
    boost::array<std::string, NUM_STRANDEDNESS> strings_;
};

inline
std::string const& StrandednessNames::operator[](Strandedness s) const {
    return strings_[int(s)];
}

extern const StrandednessNames STRANDEDNESS_NAMES;

inline
std::ostream& operator<<(std::ostream& os, Strandedness s) {
    return os << STRANDEDNESS_NAMES[s];
}

END_NAMESPACE(strandcheck)
