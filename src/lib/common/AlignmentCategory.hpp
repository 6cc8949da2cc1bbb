#pragma once

#include "common/namespace.hpp"

#include <boost/array.hpp>

#include <string>

BEGIN_NAMESPACE(strandcheck)

// The single bucket an alignment record is counted in.
enum AlignmentCategory {
    FWD_PRIMARY = 0,
    REV_PRIMARY,
    UNMAPPED,
    SECONDARY,
    SUPPLEMENTARY,
    LOW_MAPQ,
    NUM_ALIGNMENT_CATEGORIES
};

template<typename T>
struct PerCategoryArray {
    typedef boost::array<T, NUM_ALIGNMENT_CATEGORIES> type;
};

struct CategoryNames {
    CategoryNames();

    std::string const& operator[](AlignmentCategory cat) const;

private:
    PerCategoryArray<std::string>::type strings_;
};

inline
std::string const& CategoryNames::operator[](AlignmentCategory cat) const {
    return strings_[int(cat)];
}

extern const CategoryNames CATEGORY_NAMES;

END_NAMESPACE(strandcheck)
