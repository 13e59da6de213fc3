#ifndef OMR_SHAPE_DETECTOR_HPP
#define OMR_SHAPE_DETECTOR_HPP

#include "omr/Layout.hpp"
#include "omr/Types.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace omr {

struct DetectorParams {
    int minSide = 10;                // px, both box sides
    double aspectMin = 0.5;          // width / height
    double aspectMax = 1.5;
    double minArea = 50.0;           // contour area, px
    double maxArea = 0.0;            // 0 = unbounded
    double candidateTolerance = 1.0; // fraction of layout.cellCount() required
};

class ShapeDetector {
public:
    explicit ShapeDetector(const DetectorParams& params = DetectorParams());

    // Bubble-like external regions of the mask, in detection order.
    std::vector<ShapeCandidate> findBubbleShapes(const cv::Mat& mask) const;

    // Same as findBubbleShapes, but throws InsufficientCandidates when fewer
    // survive than the layout requires.
    std::vector<ShapeCandidate> detectCandidates(const cv::Mat& mask, const Layout& layout) const;

    int requiredCandidates(const Layout& layout) const;

    const DetectorParams& params() const { return params_; }

private:
    DetectorParams params_;

    bool isBubbleLike(const cv::Rect& box, double area) const;
};

} // namespace omr

#endif // OMR_SHAPE_DETECTOR_HPP
