#ifndef OMR_MARK_EVALUATOR_HPP
#define OMR_MARK_EVALUATOR_HPP

#include "omr/Types.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace omr {

struct EvaluatorParams {
    enum Measure {
        Ratio,    // ink pixels / region pixels
        Pixels    // absolute ink pixel count
    };

    Measure measure = Ratio;
    double fillThreshold = 0.6;   // a bubble counts as marked strictly above this
    double fillMargin = 0.15;     // best must beat the runner-up by this much
};

struct BubbleMeasurement {
    GridCell cell;
    int inkPixels = 0;
    int regionPixels = 0;
    double ratio = 0.0;
};

class MarkEvaluator {
public:
    explicit MarkEvaluator(const EvaluatorParams& params = EvaluatorParams());

    // Ink inside each cell's filled contour, in the order of cells.
    std::vector<BubbleMeasurement> measure(const cv::Mat& mask,
                                           const std::vector<GridCell>& cells) const;

    Responses classify(const std::vector<BubbleMeasurement>& measurements) const;

    Responses evaluate(const cv::Mat& mask, const std::vector<GridCell>& cells) const {
        return classify(measure(mask, cells));
    }

    // Decision for one question; fills[i] is the measure of option i.
    Response classifyQuestion(const std::vector<double>& fills) const;

    double fillValue(const BubbleMeasurement& m) const;

    const EvaluatorParams& params() const { return params_; }

private:
    EvaluatorParams params_;
};

} // namespace omr

#endif // OMR_MARK_EVALUATOR_HPP
