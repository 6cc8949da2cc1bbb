#include "io/SamTextRecordSource.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace strandcheck;

namespace {
    std::string samData =
        "@HD\tVN:1.0\tSO:unsorted\n"
        "@SQ\tSN:chr1\tLN:248956422\n"
        "r1\t99\tchr1\t100\t60\t50M\t=\t200\t150\tACGT\tHHHH\n"
        "r1\t147\tchr1\t200\t60\t50M\t=\t100\t-150\tACGT\tHHHH\n"
        "\n"
        "r2\t4\t*\t0\t0\t*\t*\t0\t0\tACGT\tHHHH\n"
        "r3\t2048\tchr1\t300\t12\t20M30H\t*\t0\t0\tACGT\tHHHH\n"
        ;
}

TEST(TestSamTextRecordSource, read) {
    std::stringstream in(samData);
    SamTextRecordSource src(in, "-");
    EXPECT_EQ("-", src.path());

    AlignmentRecord rec;
    ASSERT_TRUE(src.next(rec));
    EXPECT_EQ(99, rec.flag);
    EXPECT_EQ(60, rec.mapq);
    EXPECT_EQ(3u, src.line_number());

    ASSERT_TRUE(src.next(rec));
    EXPECT_EQ(147, rec.flag);
    EXPECT_TRUE(rec.reversed());

    ASSERT_TRUE(src.next(rec));
    EXPECT_EQ(4, rec.flag);
    EXPECT_EQ(0, rec.mapq);
    EXPECT_TRUE(rec.unmapped());

    ASSERT_TRUE(src.next(rec));
    EXPECT_EQ(2048, rec.flag);
    EXPECT_EQ(12, rec.mapq);

    EXPECT_FALSE(src.next(rec));
    EXPECT_FALSE(src.next(rec));
}

TEST(TestSamTextRecordSource, header_only) {
    std::stringstream in("@HD\tVN:1.0\n@SQ\tSN:chr1\tLN:10\n");
    SamTextRecordSource src(in, "header.sam");
    AlignmentRecord rec;
    EXPECT_FALSE(src.next(rec));
}

TEST(TestSamTextRecordSource, too_few_columns) {
    std::stringstream in("r1\t0\tchr1\t100\n");
    SamTextRecordSource src(in, "short.sam");
    AlignmentRecord rec;
    try {
        src.next(rec);
        FAIL() << "truncated line accepted";
    }
    catch (std::runtime_error const& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("short.sam:1:"));
    }
}

TEST(TestSamTextRecordSource, bad_numbers) {
    AlignmentRecord rec;

    std::stringstream flag("r1\tx\tchr1\t100\t60\n");
    SamTextRecordSource flag_src(flag, "flag.sam");
    EXPECT_THROW(flag_src.next(rec), std::runtime_error);

    std::stringstream mapq("r1\t0\tchr1\t100\thigh\n");
    SamTextRecordSource mapq_src(mapq, "mapq.sam");
    EXPECT_THROW(mapq_src.next(rec), std::runtime_error);

    std::stringstream range("r1\t70000\tchr1\t100\t60\n");
    SamTextRecordSource range_src(range, "range.sam");
    EXPECT_THROW(range_src.next(rec), std::runtime_error);
}
