#pragma once

#include <cstddef>
#include <stdint.h>
#include <string>
#include <vector>

struct Params {
    std::vector<std::string> inputs;
    bool counts_input;
    int min_mapq;
    bool incremental;
    std::size_t block_size;
    std::size_t max_blocks;
    bool stop_when_called;
    int64_t min_total;
    double max_rel_diff;
    std::size_t threads;
    std::string out_path;
    std::string detailed_out_path;
    bool verbose;
};

Params parse_cmdline(int argc, char** argv);
