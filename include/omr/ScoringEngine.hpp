#ifndef OMR_SCORING_ENGINE_HPP
#define OMR_SCORING_ENGINE_HPP

#include "omr/AnswerKey.hpp"
#include "omr/Layout.hpp"
#include "omr/Types.hpp"
#include <string>
#include <vector>

namespace omr {

struct QuestionResult {
    int questionNumber;
    QuestionStatus status;
    std::vector<int> selected;   // empty when not attempted
    int correctOption;
};

struct SubjectScore {
    std::string name;
    int first;
    int last;
    int correct = 0;
    int total = 0;
    double percentage = 0.0;
};

struct ScoreReport {
    int totalQuestions = 0;
    int correctCount = 0;
    int incorrectCount = 0;
    int notAttemptedCount = 0;
    int multipleMarkedCount = 0;
    double percentage = 0.0;      // raw, not rounded
    double netScore = 0.0;        // correct - incorrect * penalty
    std::vector<QuestionResult> results;   // ascending question number
    std::vector<SubjectScore> subjects;
};

struct ScoringPolicy {
    double wrongAnswerPenalty = 0.0;
};

class ScoringEngine {
public:
    explicit ScoringEngine(const ScoringPolicy& policy = ScoringPolicy());

    // Scores every question of the key. Responses without a key entry are ignored.
    // Throws ConfigurationError when subjects overlap, leave gaps, or miss a keyed question.
    ScoreReport score(const Responses& responses,
                      const AnswerKey& key,
                      const std::vector<SubjectRange>& subjects = {}) const;

    static QuestionStatus statusFor(const Response* response, int correctOption);

    const ScoringPolicy& policy() const { return policy_; }

private:
    ScoringPolicy policy_;
};

std::string formatSummary(const ScoreReport& report);

} // namespace omr

#endif // OMR_SCORING_ENGINE_HPP
