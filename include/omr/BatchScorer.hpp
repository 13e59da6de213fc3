#ifndef OMR_BATCH_SCORER_HPP
#define OMR_BATCH_SCORER_HPP

#include "omr/AnswerKey.hpp"
#include "omr/SheetProcessor.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace omr {

struct BatchItem {
    std::string name;
    std::vector<uchar> bytes;
};

struct BatchEntry {
    std::string name;
    SheetResult result;
};

struct BatchSummary {
    int sheets = 0;
    int succeeded = 0;
    int failed = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    int excellent = 0;      // >= 90
    int good = 0;           // 80 - 89
    int average = 0;        // 70 - 79
    int belowAverage = 0;   // 60 - 69
    int poor = 0;           // < 60
};

// Scores independent sheets on a pool of worker threads. A failing sheet only
// produces a failed entry; its siblings are unaffected.
class BatchScorer {
public:
    // jobs <= 0 picks the hardware concurrency.
    explicit BatchScorer(const SheetProcessor& processor, int jobs = 0);

    // Entries come back in the order of items.
    std::vector<BatchEntry> run(const std::vector<BatchItem>& items, const AnswerKey& key) const;

    int jobs() const { return jobs_; }

private:
    const SheetProcessor& processor_;
    int jobs_;
};

BatchSummary summarize(const std::vector<BatchEntry>& entries);

std::string formatBatchSummary(const BatchSummary& summary);

} // namespace omr

#endif // OMR_BATCH_SCORER_HPP
