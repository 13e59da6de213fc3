#include <gtest/gtest.h>

#include "omr/Config.hpp"
#include "test_helpers.hpp"

using namespace omr;
using namespace omr::testing;

namespace {

const char* kMinimalConfig = R"(
layout:
  total_questions: 40
  options_per_question: 5
  rows_per_block: 10
  column_blocks: 4
)";

}

TEST(ConfigTest, MinimalConfigKeepsDefaults) {
    PipelineConfig cfg = parseConfig(YAML::Load(kMinimalConfig));

    EXPECT_EQ(cfg.layout.totalQuestions, 40);
    EXPECT_EQ(cfg.layout.optionsPerQuestion, 5);
    EXPECT_EQ(cfg.layout.numbering, NumberingScheme::BlockMajor);
    EXPECT_TRUE(cfg.layout.subjects.empty());

    PipelineConfig defaults;
    EXPECT_EQ(cfg.binarizer.windowSize, defaults.binarizer.windowSize);
    EXPECT_EQ(cfg.binarizer.method, BinarizerParams::Mean);
    EXPECT_FALSE(cfg.binarizer.clahe);
    EXPECT_FALSE(cfg.binarizer.denoise);
    EXPECT_FALSE(cfg.binarizer.deskew);
    EXPECT_DOUBLE_EQ(cfg.evaluator.fillThreshold, defaults.evaluator.fillThreshold);
    EXPECT_DOUBLE_EQ(cfg.evaluator.fillMargin, defaults.evaluator.fillMargin);
    EXPECT_TRUE(cfg.grid.pruneExcess);
    EXPECT_DOUBLE_EQ(cfg.scoring.wrongAnswerPenalty, 0.0);
    EXPECT_FALSE(cfg.renderDebug);
}

TEST(ConfigTest, EverySectionCanBeOverridden) {
    PipelineConfig cfg = parseConfig(YAML::Load(R"(
layout:
  total_questions: 6
  options_per_question: 4
  rows_per_block: 3
  column_blocks: 2
  numbering: Row_Major
  subjects:
    - {name: math, first: 1, last: 4}
    - {name: art, first: 5, last: 6}
binarizer: {window_size: 31, bias: 7, method: gaussian, blur_kernel: 3,
            clahe: true, clahe_clip_limit: 3.5, clahe_tile_grid: 4, denoise: true,
            deskew: true, min_skew_degrees: 1.0}
detector: {min_side: 8, aspect_min: 0.7, aspect_max: 1.3, min_area: 40, max_area: 900, candidate_tolerance: 0.9}
grid: {prune_excess: false, row_spread_tolerance: 0.5}
evaluator: {measure: pixels, fill_threshold: 120, fill_margin: 30}
scoring: {wrong_answer_penalty: 0.25}
debug: true
)"));

    EXPECT_EQ(cfg.layout.numbering, NumberingScheme::RowMajor);
    ASSERT_EQ(cfg.layout.subjects.size(), 2u);
    EXPECT_EQ(cfg.layout.subjects[1].name, "art");
    EXPECT_EQ(cfg.layout.subjects[1].first, 5);

    EXPECT_EQ(cfg.binarizer.windowSize, 31);
    EXPECT_DOUBLE_EQ(cfg.binarizer.bias, 7.0);
    EXPECT_EQ(cfg.binarizer.method, BinarizerParams::Gaussian);
    EXPECT_EQ(cfg.binarizer.blurKernel, 3);
    EXPECT_TRUE(cfg.binarizer.clahe);
    EXPECT_DOUBLE_EQ(cfg.binarizer.claheClipLimit, 3.5);
    EXPECT_EQ(cfg.binarizer.claheTileGrid, 4);
    EXPECT_TRUE(cfg.binarizer.denoise);
    EXPECT_TRUE(cfg.binarizer.deskew);
    EXPECT_DOUBLE_EQ(cfg.binarizer.minSkewDegrees, 1.0);

    EXPECT_EQ(cfg.detector.minSide, 8);
    EXPECT_DOUBLE_EQ(cfg.detector.maxArea, 900.0);
    EXPECT_DOUBLE_EQ(cfg.detector.candidateTolerance, 0.9);

    EXPECT_FALSE(cfg.grid.pruneExcess);
    EXPECT_DOUBLE_EQ(cfg.grid.rowSpreadTolerance, 0.5);

    EXPECT_EQ(cfg.evaluator.measure, EvaluatorParams::Pixels);
    EXPECT_DOUBLE_EQ(cfg.evaluator.fillThreshold, 120.0);
    EXPECT_DOUBLE_EQ(cfg.scoring.wrongAnswerPenalty, 0.25);
    EXPECT_TRUE(cfg.renderDebug);
}

TEST(ConfigTest, JsonConfigIsAccepted) {
    PipelineConfig cfg = parseConfig(YAML::Load(
        R"({"layout": {"total_questions": 100, "options_per_question": 4,
                       "rows_per_block": 20, "column_blocks": 5},
            "evaluator": {"fill_threshold": 0.55}})"));
    EXPECT_EQ(cfg.layout.cellCount(), 400);
    EXPECT_DOUBLE_EQ(cfg.evaluator.fillThreshold, 0.55);
}

TEST(ConfigTest, LayoutSectionIsRequired) {
    EXPECT_OMR_ERROR(parseConfig(YAML::Load("binarizer: {window_size: 21}")),
                     ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load("layout: 5")), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load("- a\n- b")), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(R"(
layout: {total_questions: 10, options_per_question: 4, rows_per_block: 10}
)")), ErrorKind::ConfigurationError);
}

TEST(ConfigTest, BadValuesAreConfigurationErrors) {
    std::string base = kMinimalConfig;
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(base + "binarizer: {method: otsu}\n")),
                     ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(base + "evaluator: {measure: area}\n")),
                     ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(base + "binarizer: {window_size: big}\n")),
                     ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(base + "debug: maybe\n")),
                     ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(base + "binarizer: {deskew: sometimes}\n")),
                     ErrorKind::ConfigurationError);
}

TEST(ConfigTest, InconsistentLayoutIsRejected) {
    EXPECT_OMR_ERROR(parseConfig(YAML::Load(R"(
layout: {total_questions: 41, options_per_question: 5, rows_per_block: 10, column_blocks: 4}
)")), ErrorKind::ConfigurationError);

    EXPECT_OMR_ERROR(parseConfig(YAML::Load(R"(
layout:
  total_questions: 4
  options_per_question: 4
  rows_per_block: 4
  column_blocks: 1
  subjects: [{name: a, first: 1, last: 3}, {name: b, first: 3, last: 4}]
)")), ErrorKind::ConfigurationError);
}

TEST(ConfigTest, MissingConfigFileIsAConfigurationError) {
    EXPECT_OMR_ERROR(loadConfig("/nonexistent/omrscore.yaml"), ErrorKind::ConfigurationError);
}

TEST(AnswerKeyParsingTest, JsonMapWithIndicesAndLetters) {
    Layout l = makeLayout(4, 1, 4);
    AnswerKey key = parseAnswerKey(YAML::Load(R"({"1": 0, "2": "C", "4": "d"})"), l);

    EXPECT_EQ(key.size(), 3u);
    EXPECT_EQ(key.correctOption(1), 0);
    EXPECT_EQ(key.correctOption(2), 2);
    EXPECT_FALSE(key.contains(3));
    EXPECT_EQ(key.correctOption(4), 3);
}

TEST(AnswerKeyParsingTest, LetterString) {
    AnswerKey key = parseAnswerKey(YAML::Load("letters: \"AB-D, CA\""), makeLayout(6, 1, 4));
    EXPECT_EQ(key.size(), 5u);
    EXPECT_EQ(key.correctOption(4), 3);
    EXPECT_EQ(key.correctOption(6), 0);
}

TEST(AnswerKeyParsingTest, OptionsOutsideTheLayoutAreRejected) {
    Layout l = makeLayout(4, 1, 4);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load(R"({"1": 4})"), l), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load(R"({"1": "E"})"), l), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load("letters: ABCE"), l), ErrorKind::ConfigurationError);
}

TEST(AnswerKeyParsingTest, MalformedKeysAreRejected) {
    Layout l = makeLayout(4, 1, 4);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load(R"({"one": 0})"), l), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load(R"({"0": 1})"), l), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load(R"({"1": "AB"})"), l), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Load("[0, 1, 2]"), l), ErrorKind::ConfigurationError);
    EXPECT_OMR_ERROR(parseAnswerKey(YAML::Node(), l), ErrorKind::ConfigurationError);
}

TEST(ReportTest, EmittedReportCarriesCountsAndResults) {
    ScoreReport rep;
    rep.totalQuestions = 2;
    rep.correctCount = 1;
    rep.multipleMarkedCount = 1;
    rep.percentage = 50.0;
    rep.netScore = 1.0;
    QuestionResult q1{1, QuestionStatus::Correct, {0}, 0};
    QuestionResult q2{2, QuestionStatus::MultipleMarked, {0, 1}, 1};
    rep.results = {q1, q2};

    YAML::Node back = YAML::Load(emitReport(rep));
    EXPECT_EQ(back["total_questions"].as<int>(), 2);
    EXPECT_EQ(back["multiple_marked"].as<int>(), 1);
    EXPECT_DOUBLE_EQ(back["percentage"].as<double>(), 50.0);
    ASSERT_EQ(back["results"].size(), 2u);
    EXPECT_EQ(back["results"][1]["status"].as<std::string>(), "multiple_marked");
    EXPECT_EQ(back["results"][1]["selected"].size(), 2u);
    EXPECT_FALSE(back["subjects"]);
}
