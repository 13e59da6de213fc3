#include "omr/BatchScorer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace omr {

BatchScorer::BatchScorer(const SheetProcessor& processor, int jobs)
    : processor_(processor), jobs_(jobs)
{
    if (jobs_ <= 0) {
        jobs_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<BatchEntry> BatchScorer::run(const std::vector<BatchItem>& items, const AnswerKey& key) const {
    std::vector<BatchEntry> entries(items.size());
    if (items.empty()) return entries;

    std::atomic<size_t> next{0};
    std::mutex sinkMutex;

    auto worker = [&]() {
        for (size_t i = next++; i < items.size(); i = next++) {
            SheetResult r = processor_.process(items[i].bytes, key);
            if (r.ok) {
                spdlog::info("{}: {:.2f}%", items[i].name, r.report.percentage);
            } else {
                spdlog::warn("{}: {} at {}", items[i].name, toCStr(r.error), toCStr(r.stage));
            }

            std::lock_guard<std::mutex> lock(sinkMutex);
            entries[i].name = items[i].name;
            entries[i].result = std::move(r);
        }
    };

    int n = std::min<int>(jobs_, (int)items.size());
    std::vector<std::thread> pool;
    pool.reserve(n);
    for (int t = 0; t < n; ++t) pool.emplace_back(worker);
    for (auto& th : pool) th.join();

    return entries;
}

BatchSummary summarize(const std::vector<BatchEntry>& entries) {
    BatchSummary s;
    s.sheets = (int)entries.size();

    std::vector<double> scores;
    for (const auto& e : entries) {
        if (e.result.ok) scores.push_back(e.result.report.percentage);
    }
    s.succeeded = (int)scores.size();
    s.failed = s.sheets - s.succeeded;
    if (scores.empty()) return s;

    std::sort(scores.begin(), scores.end());
    s.min = scores.front();
    s.max = scores.back();

    double sum = 0.0;
    for (double v : scores) sum += v;
    s.mean = sum / scores.size();

    size_t mid = scores.size() / 2;
    s.median = scores.size() % 2 ? scores[mid] : 0.5 * (scores[mid - 1] + scores[mid]);

    double var = 0.0;
    for (double v : scores) var += (v - s.mean) * (v - s.mean);
    s.stddev = std::sqrt(var / scores.size());

    for (double v : scores) {
        if (v >= 90.0) s.excellent++;
        else if (v >= 80.0) s.good++;
        else if (v >= 70.0) s.average++;
        else if (v >= 60.0) s.belowAverage++;
        else s.poor++;
    }
    return s;
}

std::string formatBatchSummary(const BatchSummary& s) {
    std::ostringstream ss;
    ss << "Sheets: " << s.sheets << " (scored " << s.succeeded << ", failed " << s.failed << ")\n";
    if (s.succeeded == 0) return ss.str();

    ss << std::fixed << std::setprecision(2);
    ss << "Mean: " << s.mean << "%  Median: " << s.median << "%  StdDev: " << s.stddev << "\n";
    ss << "Min: " << s.min << "%  Max: " << s.max << "%\n";
    ss << "Distribution: >=90: " << s.excellent << ", 80-89: " << s.good
       << ", 70-79: " << s.average << ", 60-69: " << s.belowAverage
       << ", <60: " << s.poor << "\n";
    return ss.str();
}

} // namespace omr
