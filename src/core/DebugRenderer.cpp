#include "omr/DebugRenderer.hpp"
#include <algorithm>

namespace omr {

namespace {

const cv::Scalar kSelected(0, 255, 0);
const cv::Scalar kAmbiguous(0, 165, 255);
const cv::Scalar kEmpty(100, 100, 100);
const cv::Scalar kCandidate(255, 0, 0);

cv::Mat toBgr(const cv::Mat& image) {
    cv::Mat bgr;
    if (image.channels() == 1) cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    else if (image.channels() == 4) cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    else bgr = image.clone();
    return bgr;
}

}

cv::Mat renderDebug(const cv::Mat& image,
                    const std::vector<BubbleMeasurement>& measurements,
                    const Responses& responses)
{
    cv::Mat dbg = toBgr(image);

    for (const auto& m : measurements) {
        const GridCell& cell = m.cell;
        cv::Scalar color = kEmpty;
        int thickness = 1;

        auto it = responses.find(cell.questionNumber);
        if (it != responses.end()) {
            const Response& r = it->second;
            bool picked = std::find(r.options.begin(), r.options.end(), cell.optionIndex) != r.options.end();
            if (picked && r.kind == Response::Single) {
                color = kSelected;
                thickness = 2;
            } else if (picked && r.kind == Response::Ambiguous) {
                color = kAmbiguous;
                thickness = 2;
            }
        }

        std::vector<std::vector<cv::Point>> one{cell.shape.contour};
        cv::drawContours(dbg, one, 0, color, thickness, cv::LINE_AA);

        std::string pct = std::to_string((int)(m.ratio * 100));
        cv::putText(dbg, pct, cv::Point(cell.shape.box.x, cell.shape.box.y - 2),
                    cv::FONT_HERSHEY_SIMPLEX, 0.3, color, 1);

        if (cell.optionIndex == 0) {
            cv::putText(dbg, std::to_string(cell.questionNumber),
                        cv::Point(cell.shape.box.x - 28, cell.shape.box.y + cell.shape.box.height - 2),
                        cv::FONT_HERSHEY_SIMPLEX, 0.35, cv::Scalar(255, 0, 255), 1);
        }
    }
    return dbg;
}

cv::Mat renderCandidates(const cv::Mat& image, const std::vector<ShapeCandidate>& candidates) {
    cv::Mat dbg = toBgr(image);
    std::vector<std::vector<cv::Point>> contours;
    contours.reserve(candidates.size());
    for (const auto& c : candidates) contours.push_back(c.contour);
    cv::drawContours(dbg, contours, -1, kCandidate, 1, cv::LINE_AA);

    std::string txt = "candidates: " + std::to_string(candidates.size());
    cv::putText(dbg, txt, cv::Point(10, 20), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 0, 255), 2);
    return dbg;
}

} // namespace omr
