#ifndef OMR_DEBUG_RENDERER_HPP
#define OMR_DEBUG_RENDERER_HPP

#include "omr/MarkEvaluator.hpp"
#include "omr/Types.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace omr {

// Green: selected option. Orange: part of an ambiguous mark. Gray: unmarked.
cv::Mat renderDebug(const cv::Mat& image,
                    const std::vector<BubbleMeasurement>& measurements,
                    const Responses& responses);

// Raw candidates in blue, for sheets that failed before grid resolution.
cv::Mat renderCandidates(const cv::Mat& image, const std::vector<ShapeCandidate>& candidates);

} // namespace omr

#endif // OMR_DEBUG_RENDERER_HPP
