#ifndef OMR_SHEET_PROCESSOR_HPP
#define OMR_SHEET_PROCESSOR_HPP

#include "omr/AnswerKey.hpp"
#include "omr/Binarizer.hpp"
#include "omr/GridResolver.hpp"
#include "omr/Layout.hpp"
#include "omr/MarkEvaluator.hpp"
#include "omr/ScoringEngine.hpp"
#include "omr/ShapeDetector.hpp"
#include "omr/Types.hpp"
#include <opencv2/opencv.hpp>
#include <exception>
#include <string>
#include <vector>

namespace omr {

struct PipelineConfig {
    Layout layout;                   // must be set by the caller
    BinarizerParams binarizer;
    DetectorParams detector;
    GridParams grid;
    EvaluatorParams evaluator;
    ScoringPolicy scoring;
    bool renderDebug = false;
};

struct SheetResult {
    bool ok = false;
    ErrorKind error = ErrorKind::None;
    Stage stage = Stage::Decode;     // stage reached, or the failing one
    std::string message;
    ScoreReport report;
    Responses responses;
    cv::Mat debugImage;              // only with PipelineConfig::renderDebug
};

// Tags an exception raised while `stage` ran. OmrError keeps its own kind and
// stage; cv::Exception is a DecodeError up to binarization and a
// ConfigurationError after it; anything else is an InternalError.
SheetResult failedSheet(const std::exception& e, Stage stage);

// Runs one sheet through binarize -> detect -> resolve -> evaluate -> score.
// All methods are const and keep no per-run state, so one processor can be
// shared by several threads.
class SheetProcessor {
public:
    // Throws OmrError(ConfigurationError) for an invalid configuration.
    explicit SheetProcessor(const PipelineConfig& config);

    // Encoded image bytes (any format cv::imdecode reads).
    SheetResult process(const std::vector<uchar>& bytes, const AnswerKey& key) const;

    SheetResult processImage(const cv::Mat& image, const AnswerKey& key) const;

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    Binarizer binarizer_;
    ShapeDetector detector_;
    GridResolver resolver_;
    MarkEvaluator evaluator_;
    ScoringEngine scorer_;
};

} // namespace omr

#endif // OMR_SHEET_PROCESSOR_HPP
