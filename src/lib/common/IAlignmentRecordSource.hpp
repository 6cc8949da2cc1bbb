#pragma once

#include "common/AlignmentRecord.hpp"
#include "common/namespace.hpp"

#include <string>

BEGIN_NAMESPACE(strandcheck)

class IAlignmentRecordSource {
public:
    virtual ~IAlignmentRecordSource() {}

    // Stores the next record in rec. Returns false at end of input and
    // throws std::runtime_error on malformed or unreadable input.
    virtual bool next(AlignmentRecord& rec) = 0;

    virtual std::string const& path() const = 0;
};

END_NAMESPACE(strandcheck)
