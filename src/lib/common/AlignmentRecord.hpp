#pragma once

#include "common/namespace.hpp"

#include <stdint.h>

BEGIN_NAMESPACE(strandcheck)

// SAM FLAG bits consulted when counting.
enum SamFlagBits {
    FLAG_UNMAPPED = 0x4,
    FLAG_REVERSE = 0x10,
    FLAG_SECONDARY = 0x100,
    FLAG_SUPPLEMENTARY = 0x800
};

// The two fields of an aligned-read record that strand counting needs.
struct AlignmentRecord {
    AlignmentRecord()
        : flag(0)
        , mapq(0)
    {}

    AlignmentRecord(uint16_t flag, int mapq)
        : flag(flag)
        , mapq(mapq)
    {}

    bool unmapped() const { return flag & FLAG_UNMAPPED; }
    bool reversed() const { return flag & FLAG_REVERSE; }
    bool secondary() const { return flag & FLAG_SECONDARY; }
    bool supplementary() const { return flag & FLAG_SUPPLEMENTARY; }

    uint16_t flag;
    int mapq;
};

END_NAMESPACE(strandcheck)
