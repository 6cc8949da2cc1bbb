#include "strandcheck/BatchRunner.hpp"
#include "strandcheck/StrandClassifier.hpp"

#include "TestSources.hpp"

#include <gtest/gtest.h>

#include <boost/bind/bind.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace strandcheck;

namespace {
    // "fwd<N>" yields N forward reads, "rev<N>" N reverse reads,
    // "mix<N>" N reads cycling fwd, rev, rev, unmapped.
    IAlignmentRecordSource* openTestSource(std::string const& path) {
        if (path == "missing")
            throw std::runtime_error("Failed to open input file missing");
        if (path == "broken")
            return new FailingRecordSource(path);

        std::vector<AlignmentRecord> pattern;
        std::string kind = path.substr(0, 3);
        std::size_t n = std::stoul(path.substr(3));
        if (kind == "fwd") {
            pattern.push_back(AlignmentRecord(0, 60));
        }
        else if (kind == "rev") {
            pattern.push_back(AlignmentRecord(16, 60));
        }
        else {
            pattern.push_back(AlignmentRecord(0, 60));
            pattern.push_back(AlignmentRecord(16, 60));
            pattern.push_back(AlignmentRecord(16, 60));
            pattern.push_back(AlignmentRecord(4, 0));
        }
        return new PatternRecordSource(pattern, n, path);
    }
}

TEST(TestBatchRunner, single_pass) {
    AlignmentCountExtractor extractor;
    BatchRunner runner(extractor, &openTestSource, 1);

    std::vector<std::string> paths;
    paths.push_back("fwd100");
    paths.push_back("mix400");
    std::vector<BatchResult> results = runner.run(paths);

    ASSERT_EQ(2u, results.size());
    EXPECT_EQ("fwd100", results[0].path);
    EXPECT_FALSE(results[0].failed);
    ASSERT_EQ(1u, results[0].snapshots.size());
    EXPECT_EQ(100, results[0].snapshots[0].fwd);
    EXPECT_FALSE(results[0].snapshots[0].has_label());

    ASSERT_EQ(1u, results[1].snapshots.size());
    EXPECT_EQ(400, results[1].snapshots[0].total);
    EXPECT_EQ(100, results[1].snapshots[0].fwd);
    EXPECT_EQ(200, results[1].snapshots[0].rev);
    EXPECT_EQ(100, results[1].snapshots[0].unmapped);
}

TEST(TestBatchRunner, results_keep_input_order_across_threads) {
    AlignmentCountExtractor extractor;
    BatchRunner runner(extractor, &openTestSource, 4);

    std::vector<std::string> paths;
    for (int i = 1; i <= 20; ++i)
        paths.push_back("rev" + std::to_string(i * 1000));

    std::vector<BatchResult> results = runner.run(paths);
    ASSERT_EQ(paths.size(), results.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ(paths[i], results[i].path);
        EXPECT_FALSE(results[i].failed);
        ASSERT_EQ(1u, results[i].snapshots.size());
        EXPECT_EQ(int64_t((i + 1) * 1000), results[i].snapshots[0].rev);
    }
}

TEST(TestBatchRunner, failures_are_isolated) {
    AlignmentCountExtractor extractor;
    BatchRunner runner(extractor, &openTestSource, 2);

    std::vector<std::string> paths;
    paths.push_back("missing");
    paths.push_back("fwd10");
    paths.push_back("broken");
    std::vector<BatchResult> results = runner.run(paths);

    ASSERT_EQ(3u, results.size());
    EXPECT_TRUE(results[0].failed);
    EXPECT_EQ("Failed to open input file missing", results[0].error);
    EXPECT_FALSE(results[1].failed);
    EXPECT_EQ(10, results[1].snapshots[0].fwd);
    EXPECT_TRUE(results[2].failed);
    EXPECT_TRUE(results[2].snapshots.empty());
}

TEST(TestBatchRunner, incremental) {
    ExtractorConfig cfg;
    cfg.block_size = 1000;
    cfg.max_blocks = 4;
    AlignmentCountExtractor extractor(cfg);
    BatchRunner runner(extractor, &openTestSource, 1, true);

    std::vector<std::string> paths(1, "mix3500");
    std::vector<BatchResult> results = runner.run(paths);

    ASSERT_EQ(1u, results.size());
    std::vector<CountSnapshot> const& snaps = results[0].snapshots;
    ASSERT_EQ(4u, snaps.size());
    EXPECT_EQ("1K", snaps[0].label);
    EXPECT_EQ("4K_partial", snaps[3].label);
    EXPECT_EQ(3500, snaps[3].total);
}

TEST(TestBatchRunner, incremental_stops_once_decided) {
    ExtractorConfig cfg;
    cfg.block_size = 1000;
    cfg.max_blocks = 0;
    AlignmentCountExtractor extractor(cfg);
    StrandClassifier classifier;

    BatchRunner runner(extractor, &openTestSource, 1, true);
    runner.set_stop_predicate(boost::bind(
        &StrandClassifier::decided, &classifier, boost::placeholders::_1));

    std::vector<std::string> paths(1, "rev100000");
    std::vector<BatchResult> results = runner.run(paths);

    // 3000 reads is not enough, 4000 is
    ASSERT_EQ(4u, results[0].snapshots.size());
    EXPECT_EQ(4000, results[0].snapshots.back().rev);
    EXPECT_EQ(FR_SECONDSTRAND,
        classifier.classify(results[0].snapshots.back()).strandedness);
}

TEST(TestBatchRunner, log) {
    AlignmentCountExtractor extractor;
    std::stringstream log;
    BatchRunner runner(extractor, &openTestSource, 1, false, &log);

    std::vector<std::string> paths;
    paths.push_back("fwd25");
    runner.run(paths);

    std::string msg = log.str();
    EXPECT_NE(std::string::npos, msg.find("Processing fwd25"));
    EXPECT_NE(std::string::npos, msg.find("fwd25: 25 reads (25 forward, 0 reverse)"));
}

TEST(TestBatchRunner, warns_without_informative_reads) {
    ExtractorConfig cfg;
    cfg.min_mapq = 100;
    AlignmentCountExtractor extractor(cfg);
    std::stringstream log;
    BatchRunner runner(extractor, &openTestSource, 1, false, &log);

    std::vector<std::string> paths(1, "fwd25");
    std::vector<BatchResult> results = runner.run(paths);

    EXPECT_EQ(25, results[0].snapshots[0].low_mapq);
    EXPECT_NE(std::string::npos, log.str().find("Warning: fwd25"));
}
