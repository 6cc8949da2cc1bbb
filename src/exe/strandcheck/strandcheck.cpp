#include "Params.hpp"

#include "io/CountsFile.hpp"
#include "io/RecordSourceIo.hpp"
#include "io/ReportWriter.hpp"
#include "strandcheck/AlignmentCountExtractor.hpp"
#include "strandcheck/BatchRunner.hpp"
#include "strandcheck/StrandClassifier.hpp"

#include <boost/bind/bind.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace strandcheck;

namespace {
    bool classify_counts_files(
              Params const& params
            , StrandClassifier const& classifier
            , std::vector<ReportRow>& rows)
    {
        bool ok = true;
        std::vector<CountsInput> inputs = read_counts_inputs(params.inputs, std::cin);
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            CountsInput const& input = inputs[i];
            if (input.failed) {
                std::cerr << "Error: " << input.path << ": " << input.error << "\n";
                ok = false;
                continue;
            }

            for (std::size_t j = 0; j < input.records.size(); ++j) {
                CountsRecord const& rec = input.records[j];
                rows.push_back(ReportRow(
                    report_file_column(rec.name, rec.counts.label),
                    classifier.classify(rec.counts)));
            }
        }
        return ok;
    }

    bool classify_alignments(
              Params const& params
            , StrandClassifier const& classifier
            , std::vector<ReportRow>& rows)
    {
        ExtractorConfig ecfg;
        ecfg.min_mapq = params.min_mapq;
        ecfg.block_size = params.block_size;
        ecfg.max_blocks = params.max_blocks;
        AlignmentCountExtractor extractor(ecfg);

        BatchRunner runner(
              extractor
            , &openRecordSource
            , params.threads
            , params.incremental
            , params.verbose ? &std::cerr : 0
            );

        if (params.stop_when_called) {
            runner.set_stop_predicate(boost::bind(
                &StrandClassifier::decided, &classifier, boost::placeholders::_1));
        }

        bool ok = true;
        std::vector<BatchResult> results = runner.run(params.inputs);
        for (std::size_t i = 0; i < results.size(); ++i) {
            BatchResult const& result = results[i];
            if (result.failed) {
                std::cerr << "Error: " << result.path << ": " << result.error << "\n";
                ok = false;
                continue;
            }

            for (std::size_t j = 0; j < result.snapshots.size(); ++j) {
                CountSnapshot const& snap = result.snapshots[j];
                rows.push_back(ReportRow(
                    report_file_column(result.path, snap.label),
                    classifier.classify(snap)));
            }
        }
        return ok;
    }
}

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

        ClassifierConfig ccfg;
        ccfg.min_total = params.min_total;
        ccfg.max_unstranded_rel_diff = params.max_rel_diff;
        StrandClassifier classifier(ccfg);

        std::vector<ReportRow> rows;
        bool ok = params.counts_input
            ? classify_counts_files(params, classifier, rows)
            : classify_alignments(params, classifier, rows);

        write_report(*out, rows);

        if (!params.detailed_out_path.empty()) {
            std::ofstream detailed(params.detailed_out_path);
            if (!detailed) {
                throw std::runtime_error(
                    "Failed to open detailed output file " + params.detailed_out_path);
            }
            for (std::size_t i = 0; i < rows.size(); ++i)
                write_detailed_report(detailed, rows[i]);
        }

        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (std::exception const& e) {
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
