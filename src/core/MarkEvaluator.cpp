#include "omr/MarkEvaluator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <climits>

namespace omr {

MarkEvaluator::MarkEvaluator(const EvaluatorParams& params)
    : params_(params)
{
    if (params_.fillThreshold < 0.0 || params_.fillMargin < 0.0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "fill threshold and margin must not be negative");
    }
    if (params_.measure == EvaluatorParams::Ratio && params_.fillThreshold >= 1.0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "ratio fill threshold must be below 1.0");
    }
}

double MarkEvaluator::fillValue(const BubbleMeasurement& m) const {
    return params_.measure == EvaluatorParams::Pixels ? (double)m.inkPixels : m.ratio;
}

std::vector<BubbleMeasurement> MarkEvaluator::measure(const cv::Mat& mask,
                                                      const std::vector<GridCell>& cells) const
{
    CV_Assert(!mask.empty() && mask.type() == CV_8UC1);

    const cv::Rect bounds(0, 0, mask.cols, mask.rows);
    std::vector<BubbleMeasurement> out;
    out.reserve(cells.size());

    for (const auto& cell : cells) {
        BubbleMeasurement m;
        m.cell = cell;

        cv::Rect roi = cell.shape.box & bounds;
        if (roi.area() > 0 && !cell.shape.contour.empty()) {
            // Region = filled outer contour, so only pixels inside the bubble count.
            cv::Mat region = cv::Mat::zeros(roi.size(), CV_8UC1);
            std::vector<std::vector<cv::Point>> one{cell.shape.contour};
            cv::drawContours(region, one, 0, cv::Scalar(255), cv::FILLED, cv::LINE_8,
                             cv::noArray(), INT_MAX, -roi.tl());

            cv::Mat ink;
            cv::bitwise_and(mask(roi), region, ink);

            m.regionPixels = cv::countNonZero(region);
            m.inkPixels = cv::countNonZero(ink);
            m.ratio = m.regionPixels > 0 ? (double)m.inkPixels / m.regionPixels : 0.0;
        }
        out.push_back(std::move(m));
    }
    return out;
}

Response MarkEvaluator::classifyQuestion(const std::vector<double>& fills) const {
    int bestIdx = -1;
    double bestVal = 0.0;
    double secondVal = 0.0;
    std::vector<int> above;

    for (int i = 0; i < (int)fills.size(); ++i) {
        double v = fills[i];
        if (v > params_.fillThreshold) above.push_back(i);

        if (bestIdx < 0 || v > bestVal) {
            if (bestIdx >= 0) secondVal = bestVal;
            bestVal = v;
            bestIdx = i;
        } else if (v > secondVal) {
            secondVal = v;
        }
    }

    if (above.empty()) return Response::none();
    if (above.size() == 1) return Response::single(above.front());
    // A shared maximum is never a single answer, whatever the margin.
    if (bestVal > secondVal && bestVal - secondVal >= params_.fillMargin) {
        return Response::single(bestIdx);
    }

    std::vector<int> tied;
    for (int i : above) {
        if (fills[i] == bestVal || bestVal - fills[i] < params_.fillMargin) tied.push_back(i);
    }
    return Response::ambiguous(tied);
}

Responses MarkEvaluator::classify(const std::vector<BubbleMeasurement>& measurements) const {
    std::map<int, std::vector<double>> byQuestion;
    for (const auto& m : measurements) {
        auto& fills = byQuestion[m.cell.questionNumber];
        if ((int)fills.size() <= m.cell.optionIndex) fills.resize(m.cell.optionIndex + 1, 0.0);
        fills[m.cell.optionIndex] = fillValue(m);
    }

    Responses out;
    int marked = 0, ambiguous = 0;
    for (const auto& [question, fills] : byQuestion) {
        Response r = classifyQuestion(fills);
        if (r.kind == Response::Single) marked++;
        if (r.kind == Response::Ambiguous) ambiguous++;
        out[question] = r;
    }

    spdlog::debug("mark evaluator: {} questions, {} marked, {} ambiguous",
                  out.size(), marked, ambiguous);
    return out;
}

} // namespace omr
