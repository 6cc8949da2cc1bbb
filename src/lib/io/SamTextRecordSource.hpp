#pragma once

#include "common/IAlignmentRecordSource.hpp"
#include "common/namespace.hpp"

#include <boost/range/iterator_range.hpp>

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

BEGIN_NAMESPACE(strandcheck)

// Pulls FLAG (column 2) and MAPQ (column 5) out of SAM text, e.g. an aligner
// writing to a pipe. Header lines are skipped. The stream must outlive the
// source.
class SamTextRecordSource : public IAlignmentRecordSource {
public:
    SamTextRecordSource(std::istream& in, std::string const& path);

    bool next(AlignmentRecord& rec);
    std::string const& path() const;

    std::size_t line_number() const;

private:
    typedef boost::iterator_range<std::string::const_iterator> Field;

    std::istream& in_;
    std::string path_;
    std::string line_;
    std::vector<Field> fields_;
    std::size_t line_number_;
};

END_NAMESPACE(strandcheck)
