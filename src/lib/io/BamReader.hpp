#pragma once

#include "io/RawBamEntry.hpp"

#include "common/IAlignmentRecordSource.hpp"
#include "common/namespace.hpp"

#include <boost/noncopyable.hpp>

#include <sam.h>

#include <string>

BEGIN_NAMESPACE(strandcheck)

// Reads FLAG and MAPQ from a SAM (".sam" suffix) or BAM file via samtools.
class BamReader : public IAlignmentRecordSource, private boost::noncopyable {
public:
    explicit BamReader(std::string const& path);
    ~BamReader();

    bool next(AlignmentRecord& rec);
    std::string const& path() const;

    bam_header_t* header() const;

private:
    std::string _path;
    samfile_t* _in;
    RawBamEntry _entry;
    std::size_t _records;
};

END_NAMESPACE(strandcheck)
