#pragma once

#include "common/IAlignmentRecordSource.hpp"
#include "common/namespace.hpp"

#include <string>

BEGIN_NAMESPACE(strandcheck)

extern std::string const STDIN_PATH;

// "-" reads SAM text from stdin; anything else is opened with samtools
// (SAM for a ".sam" suffix, BAM otherwise). Caller owns the result.
IAlignmentRecordSource* openRecordSource(std::string const& path);

END_NAMESPACE(strandcheck)
