#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct Params {
    std::vector<std::string> inputs;
    std::string name;
    int min_mapq;
    bool incremental;
    std::size_t block_size;
    std::size_t max_blocks;
    std::size_t threads;
    std::string out_path;
    bool verbose;
};

Params parse_cmdline(int argc, char** argv);
