#include "CountsFile.hpp"

#include "io/RecordSourceIo.hpp"

#include "common/utility.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/range/iterator_range.hpp>

#include <fstream>
#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(strandcheck)

namespace {
    typedef boost::iterator_range<std::string::const_iterator> Field;

    // total fwd rev unmapped secondary supplementary, common to every layout
    std::size_t const NUM_LEADING_COUNTS = 6;
    std::size_t const MIN_COLUMNS = 8;
    std::string const NO_LABEL("-");
    std::string const PARTIAL_SUFFIX("_partial");

    std::string field_str(Field const& f) {
        return std::string(f.begin(), f.end());
    }

    bool is_count(std::string const& s) {
        return !s.empty() && boost::algorithm::all(s, boost::is_digit());
    }

    // "-", or a compact read count ("4M", "250K", "1500") with an optional
    // "_partial" suffix.
    bool is_block_label(std::string s) {
        if (s == NO_LABEL)
            return true;
        if (ends_with(s, PARTIAL_SUFFIX))
            s.resize(s.size() - PARTIAL_SUFFIX.size());
        if (!s.empty() && (s[s.size() - 1] == 'M' || s[s.size() - 1] == 'K'))
            s.resize(s.size() - 1);
        return is_count(s);
    }

    int64_t parse_count(
              std::string const& field
            , char const* column
            , std::string const& path
            , std::size_t line_num)
    {
        try {
            return boost::lexical_cast<int64_t>(field);
        }
        catch (boost::bad_lexical_cast const&) {
            throw std::runtime_error(str(format(
                "%1%:%2%: invalid %3% count '%4%'")
                % path % line_num % column % field));
        }
    }
}

void write_counts_header(std::ostream& out) {
    out << "#total\tfwd\trev\tunmapped\tsecondary\tsupplementary\tlow_mapq"
        << "\tlabel\tname\n";
}

void write_counts_line(
          std::ostream& out
        , std::string const& name
        , CountSnapshot const& counts
        )
{
    out << counts.total
        << "\t" << counts.fwd
        << "\t" << counts.rev
        << "\t" << counts.unmapped
        << "\t" << counts.secondary
        << "\t" << counts.supplementary
        << "\t" << counts.low_mapq
        << "\t" << (counts.has_label() ? counts.label : NO_LABEL)
        << "\t" << name
        << "\n";
}

std::vector<CountsRecord> read_counts(std::istream& in, std::string const& path) {
    static char const* const COLUMN_NAMES[] = {
        "total", "fwd", "rev", "unmapped", "secondary", "supplementary"
    };

    std::vector<CountsRecord> rv;
    std::vector<std::string> lines = read_lines(in);
    std::vector<Field> fields;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::size_t line_num = i + 1;
        std::string const line = boost::trim_copy(lines[i]);
        if (line.empty() || line[0] == '#')
            continue;

        boost::split(fields, line, boost::is_any_of(" \t"), boost::token_compress_on);
        if (fields.size() < MIN_COLUMNS) {
            throw std::runtime_error(str(format(
                "%1%:%2%: expected at least %3% whitespace separated columns, got %4%")
                % path % line_num % MIN_COLUMNS % fields.size()));
        }

        CountsRecord rec;
        CountSnapshot& c = rec.counts;
        int64_t* const leading[] = {
            &c.total, &c.fwd, &c.rev, &c.unmapped, &c.secondary, &c.supplementary
        };
        for (std::size_t col = 0; col < NUM_LEADING_COUNTS; ++col) {
            *leading[col] = parse_count(
                field_str(fields[col]), COLUMN_NAMES[col], path, line_num);
        }

        // Column 7 is low_mapq unless it is a block label (incremental counts
        // without a quality bucket). After low_mapq comes either a label and
        // the name, or the name alone.
        std::string const seventh = field_str(fields[NUM_LEADING_COUNTS]);
        std::size_t name_col = NUM_LEADING_COUNTS + 1;
        if (is_count(seventh)) {
            c.low_mapq = parse_count(seventh, "low_mapq", path, line_num);
            if (fields.size() > name_col + 1
                && is_block_label(field_str(fields[name_col])))
            {
                std::string const label = field_str(fields[name_col]);
                if (label != NO_LABEL)
                    c.label = label;
                ++name_col;
            }
        }
        else if (is_block_label(seventh)) {
            c.label = seventh;
        }
        else {
            throw std::runtime_error(str(format(
                "%1%:%2%: invalid low_mapq count or block label '%3%'")
                % path % line_num % seventh));
        }

        // The name runs to the end of the line and may contain spaces.
        rec.name.assign(fields[name_col].begin(), line.end());

        try {
            c.validate();
        }
        catch (std::invalid_argument const& e) {
            throw std::invalid_argument(str(format("%1%:%2%: %3%")
                % path % line_num % e.what()));
        }

        rv.push_back(rec);
    }

    return rv;
}

std::vector<CountsRecord> read_counts_file(std::string const& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open counts file: " + path);
    }
    return read_counts(in, path);
}

std::vector<CountsInput> read_counts_inputs(
          std::vector<std::string> const& paths
        , std::istream& stdin_stream
        )
{
    std::vector<CountsInput> rv(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        CountsInput& input = rv[i];
        input.path = paths[i];
        try {
            input.records = input.path == STDIN_PATH
                ? read_counts(stdin_stream, input.path)
                : read_counts_file(input.path);
        }
        catch (std::exception const& e) {
            input.records.clear();
            input.failed = true;
            input.error = e.what();
        }
    }
    return rv;
}

END_NAMESPACE(strandcheck)
