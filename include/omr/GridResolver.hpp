#ifndef OMR_GRID_RESOLVER_HPP
#define OMR_GRID_RESOLVER_HPP

#include "omr/Layout.hpp"
#include "omr/Types.hpp"
#include <vector>

namespace omr {

struct GridParams {
    bool pruneExcess = true;           // drop area outliers when there are too many candidates
    double rowSpreadTolerance = 1.0;   // max center-y spread in a row, in median bubble heights
};

// Orders bubble candidates into a question x option grid.
//
// Candidates are sorted top to bottom by center, cut into physical rows of
// optionsPerQuestion * columnBlocks, each row is sorted left to right and split
// into columnBlocks groups of optionsPerQuestion. A row is accepted only when its
// centers stay within rowSpreadTolerance median heights of each other.
class GridResolver {
public:
    explicit GridResolver(const GridParams& params = GridParams());

    // Cells ordered by (questionNumber, optionIndex). Throws LayoutMismatch.
    std::vector<GridCell> resolveGrid(const std::vector<ShapeCandidate>& candidates,
                                      const Layout& layout) const;

    const GridParams& params() const { return params_; }

private:
    GridParams params_;

    std::vector<ShapeCandidate> pruneToCount(const std::vector<ShapeCandidate>& candidates,
                                             int count) const;
    static void checkCoverage(const std::vector<GridCell>& cells, const Layout& layout);
};

} // namespace omr

#endif // OMR_GRID_RESOLVER_HPP
