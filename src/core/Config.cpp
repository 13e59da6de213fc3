#include "omr/Config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace omr {

namespace {

[[noreturn]] void configError(const std::string& msg) {
    throw OmrError(ErrorKind::ConfigurationError, Stage::Configure, msg);
}

template <typename T>
T valueOr(const YAML::Node& section, const char* key, T fallback) {
    if (!section || !section[key]) return fallback;
    try {
        return section[key].as<T>();
    } catch (const YAML::Exception& e) {
        configError(std::string("bad value for '") + key + "': " + e.what());
    }
}

template <typename T>
T required(const YAML::Node& section, const char* key) {
    if (!section[key]) configError(std::string("missing required key '") + key + "'");
    return valueOr<T>(section, key, T());
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

Layout parseLayout(const YAML::Node& n) {
    if (!n || !n.IsMap()) configError("missing 'layout' section");

    Layout l;
    l.totalQuestions = required<int>(n, "total_questions");
    l.optionsPerQuestion = required<int>(n, "options_per_question");
    l.rowsPerBlock = required<int>(n, "rows_per_block");
    l.columnBlocks = required<int>(n, "column_blocks");

    std::string numbering = lower(valueOr<std::string>(n, "numbering", "block_major"));
    if (numbering == "block_major") l.numbering = NumberingScheme::BlockMajor;
    else if (numbering == "row_major") l.numbering = NumberingScheme::RowMajor;
    else configError("unknown numbering scheme '" + numbering + "'");

    const YAML::Node subjects = n["subjects"];
    if (subjects) {
        if (!subjects.IsSequence()) configError("'subjects' must be a list");
        for (const auto& s : subjects) {
            SubjectRange r;
            r.name = required<std::string>(s, "name");
            r.first = required<int>(s, "first");
            r.last = required<int>(s, "last");
            l.subjects.push_back(r);
        }
    }

    l.validate();
    return l;
}

int parseOption(const std::string& raw, int question) {
    std::string v = raw;
    v.erase(std::remove_if(v.begin(), v.end(), [](unsigned char c) { return std::isspace(c); }), v.end());
    if (v.empty()) configError("empty answer for question " + std::to_string(question));

    if (v.size() < 10 && std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::stoi(v);
    }
    if (v.size() == 1 && std::isalpha((unsigned char)v[0])) {
        return std::toupper((unsigned char)v[0]) - 'A';
    }
    configError("answer '" + raw + "' for question " + std::to_string(question) +
                " is neither an option index nor a letter");
}

int parseQuestion(const std::string& raw) {
    if (raw.empty() || raw.size() > 9 || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c); })) {
        configError("question number '" + raw + "' is not a valid integer");
    }
    return std::stoi(raw);
}

PipelineConfig parseConfigNode(const YAML::Node& root) {
    if (!root || !root.IsMap()) configError("configuration must be a mapping");

    PipelineConfig cfg;
    cfg.layout = parseLayout(root["layout"]);

    const YAML::Node b = root["binarizer"];
    cfg.binarizer.windowSize = valueOr(b, "window_size", cfg.binarizer.windowSize);
    cfg.binarizer.bias = valueOr(b, "bias", cfg.binarizer.bias);
    cfg.binarizer.blurKernel = valueOr(b, "blur_kernel", cfg.binarizer.blurKernel);
    std::string method = lower(valueOr<std::string>(b, "method", "mean"));
    if (method == "mean") cfg.binarizer.method = BinarizerParams::Mean;
    else if (method == "gaussian") cfg.binarizer.method = BinarizerParams::Gaussian;
    else configError("unknown binarizer method '" + method + "'");
    cfg.binarizer.clahe = valueOr(b, "clahe", cfg.binarizer.clahe);
    cfg.binarizer.claheClipLimit = valueOr(b, "clahe_clip_limit", cfg.binarizer.claheClipLimit);
    cfg.binarizer.claheTileGrid = valueOr(b, "clahe_tile_grid", cfg.binarizer.claheTileGrid);
    cfg.binarizer.denoise = valueOr(b, "denoise", cfg.binarizer.denoise);
    cfg.binarizer.deskew = valueOr(b, "deskew", cfg.binarizer.deskew);
    cfg.binarizer.minSkewDegrees = valueOr(b, "min_skew_degrees", cfg.binarizer.minSkewDegrees);

    const YAML::Node d = root["detector"];
    cfg.detector.minSide = valueOr(d, "min_side", cfg.detector.minSide);
    cfg.detector.aspectMin = valueOr(d, "aspect_min", cfg.detector.aspectMin);
    cfg.detector.aspectMax = valueOr(d, "aspect_max", cfg.detector.aspectMax);
    cfg.detector.minArea = valueOr(d, "min_area", cfg.detector.minArea);
    cfg.detector.maxArea = valueOr(d, "max_area", cfg.detector.maxArea);
    cfg.detector.candidateTolerance = valueOr(d, "candidate_tolerance", cfg.detector.candidateTolerance);

    const YAML::Node g = root["grid"];
    cfg.grid.pruneExcess = valueOr(g, "prune_excess", cfg.grid.pruneExcess);
    cfg.grid.rowSpreadTolerance = valueOr(g, "row_spread_tolerance", cfg.grid.rowSpreadTolerance);

    const YAML::Node e = root["evaluator"];
    std::string measure = lower(valueOr<std::string>(e, "measure", "ratio"));
    if (measure == "ratio") cfg.evaluator.measure = EvaluatorParams::Ratio;
    else if (measure == "pixels") cfg.evaluator.measure = EvaluatorParams::Pixels;
    else configError("unknown fill measure '" + measure + "'");
    cfg.evaluator.fillThreshold = valueOr(e, "fill_threshold", cfg.evaluator.fillThreshold);
    cfg.evaluator.fillMargin = valueOr(e, "fill_margin", cfg.evaluator.fillMargin);

    cfg.scoring.wrongAnswerPenalty =
        valueOr(root["scoring"], "wrong_answer_penalty", cfg.scoring.wrongAnswerPenalty);

    if (root["debug"]) {
        try {
            cfg.renderDebug = root["debug"].as<bool>();
        } catch (const YAML::Exception& ex) {
            configError(std::string("bad value for 'debug': ") + ex.what());
        }
    }
    return cfg;
}

}

PipelineConfig parseConfig(const YAML::Node& root) {
    try {
        return parseConfigNode(root);
    } catch (const YAML::Exception& e) {
        configError(std::string("malformed configuration: ") + e.what());
    }
}

PipelineConfig loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        configError("cannot read config '" + path + "': " + e.what());
    }
    PipelineConfig cfg = parseConfig(root);
    spdlog::info("config '{}': {} questions, {} options, {}x{} grid, {}",
                 path, cfg.layout.totalQuestions, cfg.layout.optionsPerQuestion,
                 cfg.layout.rowsPerBlock, cfg.layout.columnBlocks, toCStr(cfg.layout.numbering));
    return cfg;
}

AnswerKey parseAnswerKey(const YAML::Node& root, const Layout& layout) {
    if (!root) configError("empty answer key");

    if (root.IsMap() && root["letters"]) {
        AnswerKey key = AnswerKey::fromLetters(valueOr<std::string>(root, "letters", ""));
        for (const auto& [q, opt] : key.answers()) {
            if (opt >= layout.optionsPerQuestion) {
                configError("answer for question " + std::to_string(q) + " is outside the " +
                            std::to_string(layout.optionsPerQuestion) + " options");
            }
        }
        return key;
    }

    if (!root.IsMap()) configError("answer key must be a mapping of question number to option");

    std::vector<AnswerKey::QuestionAnswer> answers;
    try {
        for (auto it = root.begin(); it != root.end(); ++it) {
            int q = parseQuestion(it->first.as<std::string>());
            int opt = parseOption(it->second.as<std::string>(), q);
            if (opt < 0 || opt >= layout.optionsPerQuestion) {
                configError("answer for question " + std::to_string(q) + " must be in 0.." +
                            std::to_string(layout.optionsPerQuestion - 1));
            }
            answers.push_back({q, opt});
        }
    } catch (const YAML::Exception& e) {
        configError(std::string("malformed answer key: ") + e.what());
    }
    return AnswerKey(answers);
}

AnswerKey loadAnswerKey(const std::string& path, const Layout& layout) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        configError("cannot read answer key '" + path + "': " + e.what());
    }
    AnswerKey key = parseAnswerKey(root, layout);
    spdlog::info("answer key '{}': {} questions", path, key.size());
    return key;
}

YAML::Node reportToYaml(const ScoreReport& report) {
    YAML::Node n;
    n["total_questions"] = report.totalQuestions;
    n["correct"] = report.correctCount;
    n["incorrect"] = report.incorrectCount;
    n["not_attempted"] = report.notAttemptedCount;
    n["multiple_marked"] = report.multipleMarkedCount;
    n["percentage"] = report.percentage;
    n["net_score"] = report.netScore;

    for (const auto& s : report.subjects) {
        YAML::Node sn;
        sn["name"] = s.name;
        sn["first"] = s.first;
        sn["last"] = s.last;
        sn["correct"] = s.correct;
        sn["total"] = s.total;
        sn["percentage"] = s.percentage;
        n["subjects"].push_back(sn);
    }

    for (const auto& q : report.results) {
        YAML::Node qn;
        qn["question"] = q.questionNumber;
        qn["status"] = toCStr(q.status);
        qn["correct_option"] = q.correctOption;
        YAML::Node sel(YAML::NodeType::Sequence);
        for (int o : q.selected) sel.push_back(o);
        sel.SetStyle(YAML::EmitterStyle::Flow);
        qn["selected"] = sel;
        n["results"].push_back(qn);
    }
    return n;
}

std::string emitReport(const ScoreReport& report) {
    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << reportToYaml(report);
    return out.c_str();
}

} // namespace omr
