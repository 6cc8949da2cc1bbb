#include "Params.hpp"

#include "version.h"

#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace po = boost::program_options;

Params parse_cmdline(int argc, char** argv) {
    Params rv;

    po::options_description opts;

    opts.add_options()
        ("help,h", "this message")

        ("version,v", "print version and exit")

        ("name,N"
            , po::value<std::string>(&rv.name)->default_value("")
            , "Sample name written to the counts file instead of the input "
              "path (single input only)")

        ("min-mapq,q"
            , po::value<int>(&rv.min_mapq)->default_value(20)
            , "Primary alignments with MAPQ <= this are counted as low_mapq "
              "(negative disables the filter)")

        ("incremental,I"
            , po::bool_switch(&rv.incremental)->default_value(false)
            , "Write cumulative counts after every block of reads")

        ("block-size,b"
            , po::value<std::size_t>(&rv.block_size)->default_value(1000000)
            , "Reads per block in incremental mode")

        ("max-blocks,n"
            , po::value<std::size_t>(&rv.max_blocks)->default_value(8)
            , "Maximum number of blocks to read in incremental mode "
              "(0 for no limit)")

        ("threads,t"
            , po::value<std::size_t>(&rv.threads)->default_value(1)
            , "Number of inputs to process in parallel")

        ("output,o"
            , po::value<std::string>(&rv.out_path)->default_value("-")
            , "Counts file (- for stdout)")

        ("input-file,i"
            , po::value<std::vector<std::string>>(&rv.inputs)
            , "Input files, - for SAM on stdin (positional arguments work too)")

        ("verbose,V"
            , po::bool_switch(&rv.verbose)->default_value(false)
            , "Print progress information to stderr")

        ;

    po::positional_options_description pos_opts;
    pos_opts.add("input-file", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).
              options(opts).positional(pos_opts).run(), vm);
    po::notify(vm);

    if (vm.count("help") > 0) {
        std::cerr << "Usage: " << argv[0] << " [OPTIONS] "
            << "in.sam|in.bam|- [...]\n";
        std::cerr << opts << "\n";
        std::exit(0);
    }

    if (vm.count("version") > 0) {
        std::cout << "sam2counts version " << __g_prog_version << "\n";
        std::exit(0);
    }

    if (vm.count("input-file") < 1) {
        std::cerr << "No input files given!\n";
        std::exit(1);
    }

    if (std::count(rv.inputs.begin(), rv.inputs.end(), "-") > 1) {
        std::cerr << "Standard input (-) may only be given once!\n";
        std::exit(1);
    }

    if (!rv.name.empty() && rv.inputs.size() > 1) {
        std::cerr << "--name requires a single input file!\n";
        std::exit(1);
    }

    if (rv.block_size == 0) {
        std::cerr << "--block-size must be positive!\n";
        std::exit(1);
    }

    return rv;
}
