#include "RecordSourceIo.hpp"

#include "io/BamReader.hpp"
#include "io/SamTextRecordSource.hpp"

#include <iostream>

BEGIN_NAMESPACE(strandcheck)

std::string const STDIN_PATH("-");

IAlignmentRecordSource* openRecordSource(std::string const& path) {
    if (path == STDIN_PATH)
        return new SamTextRecordSource(std::cin, path);

    return new BamReader(path);
}

END_NAMESPACE(strandcheck)
