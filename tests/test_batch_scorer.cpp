#include <gtest/gtest.h>

#include "omr/BatchScorer.hpp"
#include "omr/SampleSheet.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace omr;
using namespace omr::testing;

namespace {

std::vector<uchar> encodePng(const cv::Mat& image) {
    std::vector<uchar> buf;
    cv::imencode(".png", image, buf);
    return buf;
}

BatchEntry entryWith(const std::string& name, double percentage) {
    BatchEntry e;
    e.name = name;
    e.result.ok = true;
    e.result.report.percentage = percentage;
    return e;
}

BatchEntry failedEntry(const std::string& name) {
    BatchEntry e;
    e.name = name;
    e.result.ok = false;
    e.result.error = ErrorKind::DecodeError;
    return e;
}

}

TEST(BatchScorerTest, FailuresDoNotAffectSiblings) {
    Layout layout = makeLayout(5, 2, 4);
    AnswerKey key = AnswerKey::fromLetters("ABCDABCDAB");

    PipelineConfig cfg;
    cfg.layout = layout;
    SheetProcessor proc(cfg);

    SheetMarks half = SampleSheet::marksFromKey(key);
    for (int q = 1; q <= 5; ++q) half.erase(q);

    std::vector<BatchItem> items = {
        {"perfect.png", encodePng(SampleSheet::render(layout, SampleSheet::marksFromKey(key)))},
        {"garbage.png", {0x00, 0x01, 0x02, 0x03}},
        {"half.png", encodePng(SampleSheet::render(layout, half))},
        {"white.png", encodePng(cv::Mat(300, 400, CV_8UC3, cv::Scalar(255, 255, 255)))},
        {"blank.png", encodePng(SampleSheet::render(layout))},
    };

    std::vector<BatchEntry> entries = BatchScorer(proc, 3).run(items, key);

    ASSERT_EQ(entries.size(), items.size());
    for (size_t i = 0; i < items.size(); ++i) EXPECT_EQ(entries[i].name, items[i].name);

    EXPECT_TRUE(entries[0].result.ok);
    EXPECT_DOUBLE_EQ(entries[0].result.report.percentage, 100.0);
    EXPECT_FALSE(entries[1].result.ok);
    EXPECT_EQ(entries[1].result.error, ErrorKind::DecodeError);
    EXPECT_TRUE(entries[2].result.ok);
    EXPECT_DOUBLE_EQ(entries[2].result.report.percentage, 50.0);
    EXPECT_EQ(entries[3].result.error, ErrorKind::InsufficientCandidates);
    EXPECT_TRUE(entries[4].result.ok);
    EXPECT_DOUBLE_EQ(entries[4].result.report.percentage, 0.0);

    BatchSummary s = summarize(entries);
    EXPECT_EQ(s.sheets, 5);
    EXPECT_EQ(s.succeeded, 3);
    EXPECT_EQ(s.failed, 2);
    EXPECT_DOUBLE_EQ(s.mean, 50.0);
    EXPECT_DOUBLE_EQ(s.median, 50.0);
}

TEST(BatchScorerTest, SingleJobMatchesManyJobs) {
    Layout layout = makeLayout(4, 2, 5);
    AnswerKey key = AnswerKey::fromLetters("ABCDEABC");
    PipelineConfig cfg;
    cfg.layout = layout;
    SheetProcessor proc(cfg);

    std::vector<BatchItem> items;
    for (int i = 0; i < 8; ++i) {
        SheetMarks marks = SampleSheet::marksFromKey(key);
        for (int q = 1; q <= i; ++q) marks[q] = {(key.correctOption(q) + 1) % 5};
        items.push_back({"sheet" + std::to_string(i), encodePng(SampleSheet::render(layout, marks))});
    }

    auto serial = BatchScorer(proc, 1).run(items, key);
    auto parallel = BatchScorer(proc, 4).run(items, key);

    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        ASSERT_TRUE(serial[i].result.ok) << serial[i].result.message;
        EXPECT_EQ(parallel[i].name, serial[i].name);
        EXPECT_EQ(parallel[i].result.responses, serial[i].result.responses);
        EXPECT_EQ(serial[i].result.report.correctCount, 8 - (int)i);
    }
}

TEST(BatchScorerTest, EmptyBatchAndJobCount) {
    PipelineConfig cfg;
    cfg.layout = makeLayout(2, 1, 4);
    SheetProcessor proc(cfg);

    EXPECT_GE(BatchScorer(proc).jobs(), 1);
    EXPECT_EQ(BatchScorer(proc, 6).jobs(), 6);
    EXPECT_TRUE(BatchScorer(proc, 2).run({}, AnswerKey()).empty());
}

TEST(BatchSummaryTest, StatisticsAndDistribution) {
    std::vector<BatchEntry> entries = {
        entryWith("a", 95.0), entryWith("b", 85.0), entryWith("c", 75.0),
        entryWith("d", 65.0), entryWith("e", 30.0), failedEntry("f"),
    };
    BatchSummary s = summarize(entries);

    EXPECT_EQ(s.sheets, 6);
    EXPECT_EQ(s.succeeded, 5);
    EXPECT_EQ(s.failed, 1);
    EXPECT_DOUBLE_EQ(s.mean, 70.0);
    EXPECT_DOUBLE_EQ(s.median, 75.0);
    EXPECT_DOUBLE_EQ(s.min, 30.0);
    EXPECT_DOUBLE_EQ(s.max, 95.0);
    // Population deviation: squared offsets 625 + 225 + 25 + 25 + 1600.
    EXPECT_DOUBLE_EQ(s.stddev, std::sqrt(2500.0 / 5));
    EXPECT_EQ(s.excellent, 1);
    EXPECT_EQ(s.good, 1);
    EXPECT_EQ(s.average, 1);
    EXPECT_EQ(s.belowAverage, 1);
    EXPECT_EQ(s.poor, 1);
}

TEST(BatchSummaryTest, EvenCountMedianAndBucketEdges) {
    BatchSummary s = summarize({entryWith("a", 90.0), entryWith("b", 80.0),
                                entryWith("c", 60.0), entryWith("d", 59.99)});
    EXPECT_DOUBLE_EQ(s.median, 70.0);
    EXPECT_EQ(s.excellent, 1);
    EXPECT_EQ(s.good, 1);
    EXPECT_EQ(s.belowAverage, 1);
    EXPECT_EQ(s.poor, 1);
}

TEST(BatchSummaryTest, AllFailedHasNoStatistics) {
    BatchSummary s = summarize({failedEntry("a"), failedEntry("b")});
    EXPECT_EQ(s.failed, 2);
    EXPECT_DOUBLE_EQ(s.mean, 0.0);

    std::string text = formatBatchSummary(s);
    EXPECT_NE(text.find("Sheets: 2 (scored 0, failed 2)"), std::string::npos);
    EXPECT_EQ(text.find("Mean"), std::string::npos);
}

TEST(BatchSummaryTest, FormattedSummary) {
    std::string text = formatBatchSummary(summarize({entryWith("a", 100.0), entryWith("b", 50.0)}));
    EXPECT_NE(text.find("Sheets: 2 (scored 2, failed 0)"), std::string::npos);
    EXPECT_NE(text.find("Mean: 75.00%"), std::string::npos);
    EXPECT_NE(text.find(">=90: 1"), std::string::npos);
    EXPECT_NE(text.find("<60: 1"), std::string::npos);
}
