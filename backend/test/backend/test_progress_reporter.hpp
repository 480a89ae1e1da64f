#pragma once

#include <backend/progress/progress_reporter.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace Test
{
    class ProgressReporterTests : public ::testing::Test
    {};

    TEST_F(ProgressReporterTests, RateIsFlooredPerMille)
    {
        EXPECT_EQ(Progress::ratePerMille(1000, 0), 0);
        EXPECT_EQ(Progress::ratePerMille(1000, 1), 1);
        EXPECT_EQ(Progress::ratePerMille(3, 1), 333);
        EXPECT_EQ(Progress::ratePerMille(3, 2), 666);
        EXPECT_EQ(Progress::ratePerMille(100000, 99999), 999);
    }

    TEST_F(ProgressReporterTests, RateIsCompleteOnlyWhenAllBytesAreDone)
    {
        EXPECT_EQ(Progress::ratePerMille(5000, 5000), Progress::completeRate);
        EXPECT_LT(Progress::ratePerMille(5000, 4999), Progress::completeRate);
    }

    TEST_F(ProgressReporterTests, EmptyTransferIsCompleteImmediately)
    {
        EXPECT_EQ(Progress::ratePerMille(0, 0), Progress::completeRate);
        EXPECT_EQ(Progress::compute("empty.txt", 0, 0).ratePerMille, Progress::completeRate);
    }

    TEST_F(ProgressReporterTests, DoneBeyondTotalIsClamped)
    {
        EXPECT_EQ(Progress::ratePerMille(100, 250), Progress::completeRate);
    }

    TEST_F(ProgressReporterTests, HugeSizesDoNotOverflow)
    {
        constexpr auto total = std::numeric_limits<std::uint64_t>::max() - 1;
        const auto half = Progress::ratePerMille(total, total / 2);
        EXPECT_GE(half, 499);
        EXPECT_LE(half, 500);
        EXPECT_LT(Progress::ratePerMille(total, total - 1), Progress::completeRate);
    }

    TEST_F(ProgressReporterTests, RateIsMonotonic)
    {
        constexpr std::uint64_t total = 7919;
        int previous = 0;
        for (std::uint64_t done = 0; done <= total; done += 13)
        {
            const auto rate = Progress::compute("file.bin", total, done).ratePerMille;
            EXPECT_GE(rate, previous);
            previous = rate;
        }
        EXPECT_EQ(Progress::compute("file.bin", total, total).ratePerMille, Progress::completeRate);
    }

    TEST_F(ProgressReporterTests, LineShowsPercentageSizeAndName)
    {
        const auto sample = Progress::compute("a.txt", 2048, 1024);
        EXPECT_NE(sample.line.find(" 50.0%"), std::string::npos);
        EXPECT_NE(sample.line.find("1.0/2.0KB"), std::string::npos);
        EXPECT_NE(sample.line.find("a.txt"), std::string::npos);
        EXPECT_EQ(sample.line.find("Done!"), std::string::npos);
    }

    TEST_F(ProgressReporterTests, LargeTransfersAreShownInMegabytes)
    {
        const auto sample = Progress::compute("movie.mkv", 4 * 1024 * 1024, 4 * 1024 * 1024);
        EXPECT_NE(sample.line.find("4.0/4.0MB"), std::string::npos);
        EXPECT_NE(sample.line.find("Done!"), std::string::npos);
    }

    TEST_F(ProgressReporterTests, BarGetsShorterForLongNames)
    {
        const auto shortName = Progress::compute("a", 10, 10).line;
        const auto longName = Progress::compute("a_rather_long_file_name.txt", 10, 10).line;
        EXPECT_NE(shortName.find(std::string(40, '#')), std::string::npos);
        EXPECT_EQ(longName.find(std::string(21, '#')), std::string::npos);
        EXPECT_NE(longName.find(std::string(20, '#')), std::string::npos);
    }
}
