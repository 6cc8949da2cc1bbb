#include "Params.hpp"

#include "io/CountsFile.hpp"
#include "io/RecordSourceIo.hpp"
#include "strandcheck/AlignmentCountExtractor.hpp"
#include "strandcheck/BatchRunner.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace strandcheck;

int main(int argc, char** argv) {
    try {
        Params params = parse_cmdline(argc, argv);

        std::ofstream out_file;
        std::ostream* out(0);
        if (params.out_path.empty() || params.out_path == "-") {
            out = &std::cout;
        }
        else {
            out_file.open(params.out_path);
            if (!out_file)
                throw std::runtime_error("Failed to open output file " + params.out_path);
            out = &out_file;
        }

        ExtractorConfig cfg;
        cfg.min_mapq = params.min_mapq;
        cfg.block_size = params.block_size;
        cfg.max_blocks = params.max_blocks;
        AlignmentCountExtractor extractor(cfg);

        BatchRunner runner(
              extractor
            , &openRecordSource
            , params.threads
            , params.incremental
            , params.verbose ? &std::cerr : 0
            );

        std::vector<BatchResult> results = runner.run(params.inputs);

        bool ok = true;
        write_counts_header(*out);
        for (std::size_t i = 0; i < results.size(); ++i) {
            BatchResult const& result = results[i];
            if (result.failed) {
                std::cerr << "Error: " << result.path << ": " << result.error << "\n";
                ok = false;
                continue;
            }

            std::string const& name = params.name.empty() ? result.path : params.name;
            for (std::size_t j = 0; j < result.snapshots.size(); ++j)
                write_counts_line(*out, name, result.snapshots[j]);
        }

        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (std::exception const& e) {
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
