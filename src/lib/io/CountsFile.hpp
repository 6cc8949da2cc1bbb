#pragma once

#include "common/namespace.hpp"
#include "strandcheck/CountSnapshot.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

BEGIN_NAMESPACE(strandcheck)

// One line of a counts file:
//   total fwd rev unmapped secondary supplementary low_mapq label name
// tab separated, with "-" standing for an empty label. The reader also
// accepts the whitespace separated 8 column layouts
//   total fwd rev unmapped secondary supplementary low_mapq name
//   total fwd rev unmapped secondary supplementary label name
// written by older counting scripts.
struct CountsRecord {
    std::string name;
    CountSnapshot counts;
};

// Records read from one input, or the reason it could not be read.
struct CountsInput {
    CountsInput()
        : failed(false)
    {}

    std::string path;
    std::vector<CountsRecord> records;
    bool failed;
    std::string error;
};

void write_counts_header(std::ostream& out);
void write_counts_line(
      std::ostream& out
    , std::string const& name
    , CountSnapshot const& counts
    );

// Blank lines and lines starting with '#' are skipped. Throws
// std::runtime_error on malformed lines and std::invalid_argument on counts
// that fail CountSnapshot::validate.
std::vector<CountsRecord> read_counts(std::istream& in, std::string const& path);
std::vector<CountsRecord> read_counts_file(std::string const& path);

// Reads each path ("-" from stdin_stream). A failure is recorded on that
// input and does not stop the others.
std::vector<CountsInput> read_counts_inputs(
      std::vector<std::string> const& paths
    , std::istream& stdin_stream
    );

END_NAMESPACE(strandcheck)
