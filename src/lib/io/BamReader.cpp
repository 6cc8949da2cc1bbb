#include "BamReader.hpp"

#include "common/utility.hpp"

#include <boost/format.hpp>

#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(strandcheck)

namespace {
    char const* open_mode(std::string const& path) {
        return ends_with(path, ".sam") ? "r" : "rb";
    }
}

BamReader::BamReader(std::string const& path)
    : _path(path)
    , _in(samopen(path.c_str(), open_mode(path), 0))
    , _records(0)
{
    if (!_in || !_in->header) {
        if (_in)
            samclose(_in);
        throw std::runtime_error(str(format("Failed to open samfile %1%") % path));
    }
}

BamReader::~BamReader() {
    samclose(_in);
    _in = 0;
}

bool BamReader::next(AlignmentRecord& rec) {
    int rv = samread(_in, _entry);
    if (rv >= 0) {
        ++_records;
        rec.flag = _entry->core.flag;
        rec.mapq = _entry->core.qual;
        return true;
    }

    // -1 is a clean end of file, anything lower is truncation or corruption.
    if (rv < -1) {
        throw std::runtime_error(str(format(
            "Error reading %1% after %2% records (samread returned %3%)")
            % _path % _records % rv));
    }
    return false;
}

std::string const& BamReader::path() const {
    return _path;
}

bam_header_t* BamReader::header() const {
    return _in->header;
}

END_NAMESPACE(strandcheck)
