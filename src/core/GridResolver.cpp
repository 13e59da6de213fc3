#include "omr/GridResolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace omr {

namespace {

double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double hi = v[mid];
    if (v.size() % 2 == 1) return hi;
    double lo = *std::max_element(v.begin(), v.begin() + mid);
    return 0.5 * (lo + hi);
}

[[noreturn]] void mismatch(const std::string& msg) {
    throw OmrError(ErrorKind::LayoutMismatch, Stage::ResolveGrid, msg);
}

bool topToBottom(const ShapeCandidate& a, const ShapeCandidate& b) {
    if (a.center.y != b.center.y) return a.center.y < b.center.y;
    if (a.center.x != b.center.x) return a.center.x < b.center.x;
    return a.id < b.id;
}

bool leftToRight(const ShapeCandidate& a, const ShapeCandidate& b) {
    if (a.center.x != b.center.x) return a.center.x < b.center.x;
    return a.id < b.id;
}

}

GridResolver::GridResolver(const GridParams& params)
    : params_(params)
{
    if (params_.rowSpreadTolerance < 0.0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "row spread tolerance must not be negative");
    }
}

std::vector<ShapeCandidate> GridResolver::pruneToCount(
    const std::vector<ShapeCandidate>& candidates, int count) const
{
    std::vector<double> areas;
    areas.reserve(candidates.size());
    for (const auto& c : candidates) areas.push_back(c.area);
    double med = median(areas);

    std::vector<size_t> order(candidates.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        double da = std::abs(candidates[a].area - med);
        double db = std::abs(candidates[b].area - med);
        if (da != db) return da > db;
        return candidates[a].id > candidates[b].id;
    });

    size_t dropCount = candidates.size() - (size_t)count;
    std::vector<bool> dropped(candidates.size(), false);
    for (size_t i = 0; i < dropCount; ++i) dropped[order[i]] = true;

    std::vector<ShapeCandidate> kept;
    kept.reserve(count);
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!dropped[i]) kept.push_back(candidates[i]);
    }

    spdlog::debug("grid resolver: pruned {} area outliers (median area {:.1f})", dropCount, med);
    return kept;
}

std::vector<GridCell> GridResolver::resolveGrid(const std::vector<ShapeCandidate>& candidates,
                                                const Layout& layout) const
{
    layout.validate();

    const int expected = layout.cellCount();
    const int perRow = layout.bubblesPerRow();
    const int n = (int)candidates.size();

    if (n < expected) {
        std::ostringstream oss;
        oss << "have " << n << " candidates, the grid needs exactly " << expected;
        mismatch(oss.str());
    }

    std::vector<ShapeCandidate> sorted;
    if (n > expected) {
        if (!params_.pruneExcess) {
            std::ostringstream oss;
            oss << "have " << n << " candidates, the grid needs exactly " << expected;
            mismatch(oss.str());
        }
        sorted = pruneToCount(candidates, expected);
    } else {
        sorted = candidates;
    }

    std::sort(sorted.begin(), sorted.end(), topToBottom);

    std::vector<double> heights;
    heights.reserve(sorted.size());
    for (const auto& c : sorted) heights.push_back(c.box.height);
    const double maxSpread = params_.rowSpreadTolerance * median(heights);

    std::vector<GridCell> cells;
    cells.reserve(expected);

    for (int row = 0; row < layout.rowsPerBlock; ++row) {
        auto first = sorted.begin() + (size_t)row * perRow;
        auto last = first + perRow;

        float minY = first->center.y, maxY = first->center.y;
        for (auto it = first; it != last; ++it) {
            minY = std::min(minY, it->center.y);
            maxY = std::max(maxY, it->center.y);
        }
        if (params_.rowSpreadTolerance > 0.0 && maxY - minY > maxSpread) {
            std::ostringstream oss;
            oss << "physical row " << row << " spans " << (maxY - minY)
                << " px vertically, limit is " << maxSpread << " px";
            mismatch(oss.str());
        }

        std::sort(first, last, leftToRight);

        for (int block = 0; block < layout.columnBlocks; ++block) {
            int q = layout.questionNumber(block, row);
            for (int opt = 0; opt < layout.optionsPerQuestion; ++opt) {
                GridCell cell;
                cell.shape = *(first + block * layout.optionsPerQuestion + opt);
                cell.questionNumber = q;
                cell.optionIndex = opt;
                cells.push_back(std::move(cell));
            }
        }
    }

    std::sort(cells.begin(), cells.end(), [](const GridCell& a, const GridCell& b) {
        if (a.questionNumber != b.questionNumber) return a.questionNumber < b.questionNumber;
        return a.optionIndex < b.optionIndex;
    });

    checkCoverage(cells, layout);

    spdlog::debug("grid resolver: {} rows x {} bubbles -> {} questions",
                  layout.rowsPerBlock, perRow, layout.totalQuestions);
    return cells;
}

void GridResolver::checkCoverage(const std::vector<GridCell>& cells, const Layout& layout) {
    if ((int)cells.size() != layout.cellCount()) {
        mismatch("resolved " + std::to_string(cells.size()) + " cells, expected " +
                 std::to_string(layout.cellCount()));
    }

    std::set<std::pair<int, int>> seen;
    for (const auto& c : cells) {
        if (c.questionNumber < 1 || c.questionNumber > layout.totalQuestions ||
            c.optionIndex < 0 || c.optionIndex >= layout.optionsPerQuestion) {
            mismatch("cell (" + std::to_string(c.questionNumber) + ", " +
                     std::to_string(c.optionIndex) + ") is outside the layout");
        }
        if (!seen.insert({c.questionNumber, c.optionIndex}).second) {
            mismatch("question " + std::to_string(c.questionNumber) + " option " +
                     std::to_string(c.optionIndex) + " resolved twice");
        }
    }
}

} // namespace omr
