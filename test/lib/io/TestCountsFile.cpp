#include "io/CountsFile.hpp"

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace strandcheck;

namespace bfs = boost::filesystem;

TEST(TestCountsFile, write) {
    CountSnapshot snap;
    snap.total = 20;
    snap.fwd = 8;
    snap.rev = 7;
    snap.unmapped = 2;
    snap.secondary = 1;
    snap.supplementary = 1;
    snap.low_mapq = 1;

    std::stringstream out;
    write_counts_header(out);
    write_counts_line(out, "sample.bam", snap);
    snap.label = "1M";
    write_counts_line(out, "sample.bam", snap);

    EXPECT_EQ(
        "#total\tfwd\trev\tunmapped\tsecondary\tsupplementary\tlow_mapq\tlabel\tname\n"
        "20\t8\t7\t2\t1\t1\t1\t-\tsample.bam\n"
        "20\t8\t7\t2\t1\t1\t1\t1M\tsample.bam\n"
        , out.str());
}

TEST(TestCountsFile, read) {
    std::stringstream in(
        "#total\tfwd\trev\tunmapped\tsecondary\tsupplementary\tlow_mapq\tlabel\tname\n"
        "\n"
        "8095\t4142\t3953\t0\t0\t0\t0\t-\tsample1\n"
        "# comment\n"
        "50000\t3117\t37696\t5000\t2000\t1000\t1187\t2M\tsample2\n"
        );

    std::vector<CountsRecord> recs = read_counts(in, "counts.txt");
    ASSERT_EQ(2u, recs.size());

    EXPECT_EQ("sample1", recs[0].name);
    EXPECT_EQ(8095, recs[0].counts.total);
    EXPECT_EQ(4142, recs[0].counts.fwd);
    EXPECT_EQ(3953, recs[0].counts.rev);
    EXPECT_FALSE(recs[0].counts.has_label());

    EXPECT_EQ("sample2", recs[1].name);
    EXPECT_EQ("2M", recs[1].counts.label);
    EXPECT_EQ(5000, recs[1].counts.unmapped);
    EXPECT_EQ(1187, recs[1].counts.low_mapq);
}

TEST(TestCountsFile, write_then_read) {
    CountSnapshot snap;
    snap.total = 3500000;
    snap.fwd = 875000;
    snap.rev = 1750000;
    snap.unmapped = 875000;
    snap.label = "4M_partial";

    std::stringstream ss;
    write_counts_header(ss);
    write_counts_line(ss, "my sample", snap);

    std::vector<CountsRecord> recs = read_counts(ss, "-");
    ASSERT_EQ(1u, recs.size());
    EXPECT_EQ("my sample", recs[0].name);
    EXPECT_EQ(snap, recs[0].counts);
}

TEST(TestCountsFile, read_space_separated_whole_sample_counts) {
    // total fwd rev unmapped secondary supplementary low_mapq name
    std::stringstream in(
        "4000000 3117 37696 3959087 0 0 100 /data/sample_1.fq.gz\n"
        "9000 4142 3953 700 100 50 55 sample 2\n"
        );

    std::vector<CountsRecord> recs = read_counts(in, "sample.counts.txt");
    ASSERT_EQ(2u, recs.size());

    EXPECT_EQ("/data/sample_1.fq.gz", recs[0].name);
    EXPECT_EQ(4000000, recs[0].counts.total);
    EXPECT_EQ(3117, recs[0].counts.fwd);
    EXPECT_EQ(37696, recs[0].counts.rev);
    EXPECT_EQ(3959087, recs[0].counts.unmapped);
    EXPECT_EQ(100, recs[0].counts.low_mapq);
    EXPECT_FALSE(recs[0].counts.has_label());

    EXPECT_EQ("sample 2", recs[1].name);
    EXPECT_EQ(55, recs[1].counts.low_mapq);
    EXPECT_FALSE(recs[1].counts.has_label());
}

TEST(TestCountsFile, read_incremental_counts_without_low_mapq) {
    // total fwd rev unmapped secondary supplementary label name
    std::stringstream in(
        "1000000 800 20000 979200 0 0 1M /data/sample_1.fq.gz\n"
        "2000000\t1600\t40000\t1958400\t0\t0\t2M\t/data/sample_1.fq.gz\n"
        "2500000 2000 50000 2448000 0 0 3M_partial /data/sample_1.fq.gz\n"
        );

    std::vector<CountsRecord> recs = read_counts(in, "step.counts.txt");
    ASSERT_EQ(3u, recs.size());

    EXPECT_EQ("1M", recs[0].counts.label);
    EXPECT_EQ(0, recs[0].counts.low_mapq);
    EXPECT_EQ(800, recs[0].counts.fwd);
    EXPECT_EQ("/data/sample_1.fq.gz", recs[0].name);

    EXPECT_EQ("2M", recs[1].counts.label);
    EXPECT_EQ(40000, recs[1].counts.rev);

    EXPECT_EQ("3M_partial", recs[2].counts.label);
    EXPECT_EQ(2500000, recs[2].counts.total);
}

TEST(TestCountsFile, read_labelled_counts_with_spaces) {
    std::stringstream in("1500 10 20 0 0 0 5 1500 sample\n");
    std::vector<CountsRecord> recs = read_counts(in, "counts.txt");
    ASSERT_EQ(1u, recs.size());
    EXPECT_EQ("1500", recs[0].counts.label);
    EXPECT_EQ(5, recs[0].counts.low_mapq);
    EXPECT_EQ("sample", recs[0].name);
}

TEST(TestCountsFile, bad_label) {
    std::stringstream in("100 10 20 0 0 0 lots sample\n");
    EXPECT_THROW(read_counts(in, "counts.txt"), std::runtime_error);
}

TEST(TestCountsFile, read_inputs_isolates_failures) {
    bfs::path good = bfs::temp_directory_path()
        / bfs::unique_path("strandcheck-good-%%%%-%%%%.txt");
    bfs::path bad = bfs::temp_directory_path()
        / bfs::unique_path("strandcheck-bad-%%%%-%%%%.txt");
    bfs::path missing = bfs::temp_directory_path()
        / bfs::unique_path("strandcheck-missing-%%%%-%%%%.txt");
    {
        std::ofstream out(good.native().c_str());
        out << "8095\t4142\t3953\t0\t0\t0\t0\t-\tgood\n";
        std::ofstream out_bad(bad.native().c_str());
        out_bad << "10\t5\n";
    }

    std::vector<std::string> paths;
    paths.push_back(bad.native());
    paths.push_back(missing.native());
    paths.push_back(good.native());
    paths.push_back("-");

    std::stringstream stdin_stream("100 60 40 0 0 0 0 piped\n");
    std::vector<CountsInput> inputs = read_counts_inputs(paths, stdin_stream);
    bfs::remove(good);
    bfs::remove(bad);

    ASSERT_EQ(4u, inputs.size());

    EXPECT_EQ(bad.native(), inputs[0].path);
    EXPECT_TRUE(inputs[0].failed);
    EXPECT_TRUE(inputs[0].records.empty());
    EXPECT_NE(std::string::npos, inputs[0].error.find(":1:"));

    EXPECT_TRUE(inputs[1].failed);
    EXPECT_NE(std::string::npos, inputs[1].error.find("Failed to open"));

    EXPECT_FALSE(inputs[2].failed);
    ASSERT_EQ(1u, inputs[2].records.size());
    EXPECT_EQ("good", inputs[2].records[0].name);
    EXPECT_EQ(4142, inputs[2].records[0].counts.fwd);

    EXPECT_FALSE(inputs[3].failed);
    ASSERT_EQ(1u, inputs[3].records.size());
    EXPECT_EQ("piped", inputs[3].records[0].name);
}

TEST(TestCountsFile, wrong_column_count) {
    std::stringstream in("10\t5\t5\tsample\n");
    try {
        read_counts(in, "counts.txt");
        FAIL() << "short line accepted";
    }
    catch (std::runtime_error const& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("counts.txt:1:"));
    }
}

TEST(TestCountsFile, bad_count) {
    std::stringstream in("10\tfive\t5\t0\t0\t0\t0\t-\tsample\n");
    EXPECT_THROW(read_counts(in, "counts.txt"), std::runtime_error);
}

TEST(TestCountsFile, invalid_counts) {
    std::stringstream in("#header\n10\t8\t5\t0\t0\t0\t0\t-\tsample\n");
    try {
        read_counts(in, "counts.txt");
        FAIL() << "fwd + rev > total accepted";
    }
    catch (std::invalid_argument const& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("counts.txt:2:"));
    }

    std::stringstream neg("10\t-1\t5\t0\t0\t0\t0\t-\tsample\n");
    EXPECT_THROW(read_counts(neg, "counts.txt"), std::invalid_argument);
}

TEST(TestCountsFile, read_file) {
    bfs::path path = bfs::temp_directory_path()
        / bfs::unique_path("strandcheck-counts-%%%%-%%%%.txt");
    {
        std::ofstream out(path.native().c_str());
        out << "100\t60\t40\t0\t0\t0\t0\t-\tsample\n";
    }

    std::vector<CountsRecord> recs = read_counts_file(path.native());
    bfs::remove(path);

    ASSERT_EQ(1u, recs.size());
    EXPECT_EQ(60, recs[0].counts.fwd);

    EXPECT_THROW(read_counts_file(path.native()), std::runtime_error);
}
