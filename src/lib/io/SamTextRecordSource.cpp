#include "SamTextRecordSource.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(strandcheck)

namespace {
    std::size_t const FLAG_COLUMN = 1;
    std::size_t const MAPQ_COLUMN = 4;
    unsigned const MAX_FLAG = 0xffff;
}

SamTextRecordSource::SamTextRecordSource(std::istream& in, std::string const& path)
    : in_(in)
    , path_(path)
    , line_number_(0)
{
}

bool SamTextRecordSource::next(AlignmentRecord& rec) {
    while (std::getline(in_, line_)) {
        ++line_number_;
        if (line_.empty() || line_[0] == '@')
            continue;

        std::string const& line = line_;
        boost::split(fields_, line, boost::is_any_of("\t"));
        if (fields_.size() <= MAPQ_COLUMN) {
            throw std::runtime_error(str(format(
                "%1%:%2%: expected at least %3% tab separated columns, got %4%")
                % path_ % line_number_ % (MAPQ_COLUMN + 1) % fields_.size()));
        }

        std::string flag_str(fields_[FLAG_COLUMN].begin(), fields_[FLAG_COLUMN].end());
        std::string mapq_str(fields_[MAPQ_COLUMN].begin(), fields_[MAPQ_COLUMN].end());
        unsigned flag = 0;
        try {
            flag = boost::lexical_cast<unsigned>(flag_str);
            rec.mapq = boost::lexical_cast<int>(mapq_str);
        }
        catch (boost::bad_lexical_cast const&) {
            throw std::runtime_error(str(format(
                "%1%:%2%: invalid FLAG '%3%' or MAPQ '%4%'")
                % path_ % line_number_ % flag_str % mapq_str));
        }

        if (flag > MAX_FLAG) {
            throw std::runtime_error(str(format(
                "%1%:%2%: FLAG %3% out of range")
                % path_ % line_number_ % flag));
        }
        rec.flag = uint16_t(flag);
        return true;
    }

    if (in_.bad()) {
        throw std::runtime_error(str(format(
            "Error reading %1% after line %2%") % path_ % line_number_));
    }
    return false;
}

std::string const& SamTextRecordSource::path() const {
    return path_;
}

std::size_t SamTextRecordSource::line_number() const {
    return line_number_;
}

END_NAMESPACE(strandcheck)
