#ifndef OMR_TYPES_HPP
#define OMR_TYPES_HPP

#include <opencv2/core.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace omr {

struct ShapeCandidate {
    int id = -1;
    cv::Rect box;
    cv::Point2f center;
    double area = 0.0;                  // contour area
    std::vector<cv::Point> contour;     // outer boundary
};

struct GridCell {
    ShapeCandidate shape;
    int questionNumber = 0;             // 1-based
    int optionIndex = 0;                // 0-based, left to right
};

struct Response {
    enum Kind {
        None,
        Single,
        Ambiguous
    };

    Kind kind = None;
    std::vector<int> options;           // sorted

    static Response none() { return Response(); }
    static Response single(int option) { return Response{Single, {option}}; }
    static Response ambiguous(std::vector<int> options) {
        std::sort(options.begin(), options.end());
        return Response{Ambiguous, options};
    }

    bool operator==(const Response& o) const { return kind == o.kind && options == o.options; }
    bool operator!=(const Response& o) const { return !(*this == o); }
};

using Responses = std::map<int, Response>;

enum class QuestionStatus {
    Correct,
    Incorrect,
    NotAttempted,
    MultipleMarked
};

enum class ErrorKind {
    None = 0,
    DecodeError,
    InsufficientCandidates,
    LayoutMismatch,
    ConfigurationError,
    InternalError
};

enum class Stage {
    Configure,
    Decode,
    Binarize,
    DetectShapes,
    ResolveGrid,
    EvaluateMarks,
    Score
};

inline const char* toCStr(QuestionStatus s) {
    switch (s) {
    case QuestionStatus::Correct:        return "correct";
    case QuestionStatus::Incorrect:      return "incorrect";
    case QuestionStatus::NotAttempted:   return "not_attempted";
    case QuestionStatus::MultipleMarked: return "multiple_marked";
    default:                             return "unknown";
    }
}

inline const char* toCStr(ErrorKind e) {
    switch (e) {
    case ErrorKind::None:                   return "OK";
    case ErrorKind::DecodeError:            return "DecodeError";
    case ErrorKind::InsufficientCandidates: return "InsufficientCandidates";
    case ErrorKind::LayoutMismatch:         return "LayoutMismatch";
    case ErrorKind::ConfigurationError:     return "ConfigurationError";
    case ErrorKind::InternalError:          return "InternalError";
    default:                                return "Unknown";
    }
}

inline const char* toCStr(Stage s) {
    switch (s) {
    case Stage::Configure:     return "configure";
    case Stage::Decode:        return "decode";
    case Stage::Binarize:      return "binarize";
    case Stage::DetectShapes:  return "detect_shapes";
    case Stage::ResolveGrid:   return "resolve_grid";
    case Stage::EvaluateMarks: return "evaluate_marks";
    case Stage::Score:         return "score";
    default:                   return "unknown";
    }
}

// Thrown by the pipeline stages; SheetProcessor turns it into a tagged failure.
class OmrError : public std::runtime_error {
public:
    OmrError(ErrorKind kind, Stage stage, const std::string& message)
        : std::runtime_error(message), kind_(kind), stage_(stage) {}

    ErrorKind kind() const { return kind_; }
    Stage stage() const { return stage_; }

private:
    ErrorKind kind_;
    Stage stage_;
};

} // namespace omr

#endif // OMR_TYPES_HPP
