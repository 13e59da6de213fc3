#include "omr/SheetProcessor.hpp"
#include "omr/DebugRenderer.hpp"
#include <spdlog/spdlog.h>

namespace omr {

namespace {

SheetResult failure(ErrorKind kind, Stage stage, const std::string& message) {
    SheetResult R;
    R.ok = false;
    R.error = kind;
    R.stage = stage;
    R.message = message;
    spdlog::warn("sheet failed: {} at {}: {}", toCStr(kind), toCStr(stage), message);
    return R;
}

}

SheetResult failedSheet(const std::exception& e, Stage stage) {
    if (const auto* omr = dynamic_cast<const OmrError*>(&e)) {
        return failure(omr->kind(), omr->stage(), omr->what());
    }
    if (dynamic_cast<const cv::Exception*>(&e)) {
        bool decoding = stage == Stage::Decode || stage == Stage::Binarize;
        return failure(decoding ? ErrorKind::DecodeError : ErrorKind::ConfigurationError,
                       stage, e.what());
    }
    return failure(ErrorKind::InternalError, stage, e.what());
}

SheetProcessor::SheetProcessor(const PipelineConfig& config)
    : config_(config),
      binarizer_(config.binarizer),
      detector_(config.detector),
      resolver_(config.grid),
      evaluator_(config.evaluator),
      scorer_(config.scoring)
{
    config_.layout.validate();
}

SheetResult SheetProcessor::process(const std::vector<uchar>& bytes, const AnswerKey& key) const {
    if (bytes.empty()) {
        return failure(ErrorKind::DecodeError, Stage::Decode, "no image bytes");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const std::exception& e) {
        return failedSheet(e, Stage::Decode);
    }
    if (image.empty()) {
        return failure(ErrorKind::DecodeError, Stage::Decode,
                       "input bytes are not a decodable image (" + std::to_string(bytes.size()) + " bytes)");
    }
    return processImage(image, key);
}

SheetResult SheetProcessor::processImage(const cv::Mat& image, const AnswerKey& key) const {
    SheetResult R;
    Stage stage = Stage::Binarize;
    std::vector<ShapeCandidate> candidates;
    // Debug output is drawn over the page the contours were found on, in 8 bits.
    cv::Mat canvas = image;

    try {
        cv::Mat gray = binarizer_.condition(image);
        if (binarizer_.params().deskew || image.depth() != CV_8U) canvas = gray;
        cv::Mat mask = binarizer_.threshold(gray);

        stage = Stage::DetectShapes;
        candidates = detector_.detectCandidates(mask, config_.layout);

        stage = Stage::ResolveGrid;
        std::vector<GridCell> cells = resolver_.resolveGrid(candidates, config_.layout);

        stage = Stage::EvaluateMarks;
        std::vector<BubbleMeasurement> measurements = evaluator_.measure(mask, cells);
        R.responses = evaluator_.classify(measurements);

        stage = Stage::Score;
        R.report = scorer_.score(R.responses, key, config_.layout.subjects);

        if (config_.renderDebug) {
            R.debugImage = renderDebug(canvas, measurements, R.responses);
        }
    } catch (const OmrError& e) {
        SheetResult F = failedSheet(e, stage);
        if (config_.renderDebug && !canvas.empty()) {
            try {
                F.debugImage = renderCandidates(canvas, candidates);
            } catch (const cv::Exception& ex) {
                spdlog::warn("could not render candidates: {}", ex.what());
            }
        }
        return F;
    } catch (const std::exception& e) {
        return failedSheet(e, stage);
    }

    R.ok = true;
    R.stage = Stage::Score;
    spdlog::info("sheet scored: {}/{} correct ({:.2f}%)",
                 R.report.correctCount, R.report.totalQuestions, R.report.percentage);
    return R;
}

} // namespace omr
