#include "omr/ShapeDetector.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <sstream>

using namespace cv;

namespace omr {

ShapeDetector::ShapeDetector(const DetectorParams& params)
    : params_(params)
{
    if (params_.minSide < 1 || params_.aspectMin <= 0.0 || params_.aspectMax < params_.aspectMin ||
        params_.minArea < 0.0 || params_.maxArea < 0.0 || params_.candidateTolerance <= 0.0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "invalid shape detector bounds");
    }
}

bool ShapeDetector::isBubbleLike(const Rect& box, double area) const {
    if (box.width < params_.minSide || box.height < params_.minSide) return false;

    double ar = (double)box.width / box.height;
    if (ar < params_.aspectMin || ar > params_.aspectMax) return false;

    if (area <= params_.minArea) return false;
    if (params_.maxArea > 0.0 && area > params_.maxArea) return false;
    return true;
}

std::vector<ShapeCandidate> ShapeDetector::findBubbleShapes(const Mat& mask) const {
    CV_Assert(!mask.empty() && mask.type() == CV_8UC1);

    std::vector<std::vector<Point>> contours;
    findContours(mask.clone(), contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    std::vector<ShapeCandidate> out;
    out.reserve(contours.size());

    int rejected = 0;
    for (auto& c : contours) {
        Rect br = boundingRect(c);
        double area = contourArea(c);
        if (!isBubbleLike(br, area)) {
            rejected++;
            continue;
        }

        ShapeCandidate cand;
        cand.id = (int)out.size();
        cand.box = br;
        cand.area = area;
        Moments m = moments(c);
        if (m.m00 > 0.0) {
            cand.center = Point2f((float)(m.m10 / m.m00), (float)(m.m01 / m.m00));
        } else {
            cand.center = Point2f(br.x + br.width / 2.f, br.y + br.height / 2.f);
        }
        cand.contour = std::move(c);
        out.push_back(std::move(cand));
    }

    spdlog::debug("shape detector: {} contours, {} bubble-like, {} rejected",
                  contours.size(), out.size(), rejected);
    return out;
}

int ShapeDetector::requiredCandidates(const Layout& layout) const {
    return (int)std::ceil(layout.cellCount() * params_.candidateTolerance - 1e-9);
}

std::vector<ShapeCandidate> ShapeDetector::detectCandidates(const Mat& mask, const Layout& layout) const {
    std::vector<ShapeCandidate> cands = findBubbleShapes(mask);

    int required = requiredCandidates(layout);
    if ((int)cands.size() < required) {
        std::ostringstream oss;
        oss << "found " << cands.size() << " bubble-like regions, layout needs at least "
            << required << " (" << layout.totalQuestions << " questions x "
            << layout.optionsPerQuestion << " options)";
        throw OmrError(ErrorKind::InsufficientCandidates, Stage::DetectShapes, oss.str());
    }
    return cands;
}

} // namespace omr
