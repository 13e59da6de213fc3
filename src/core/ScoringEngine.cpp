#include "omr/ScoringEngine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace omr {

namespace {

double percentOf(int correct, int total) {
    return total > 0 ? (double)correct / total * 100.0 : 0.0;
}

std::string optionLetters(const std::vector<int>& opts) {
    if (opts.empty()) return "-";
    std::string s;
    for (size_t i = 0; i < opts.size(); ++i) {
        if (i > 0) s += ",";
        if (opts[i] >= 0 && opts[i] < 26) s += (char)('A' + opts[i]);
        else s += std::to_string(opts[i]);
    }
    return s;
}

}

ScoringEngine::ScoringEngine(const ScoringPolicy& policy)
    : policy_(policy)
{
    if (policy_.wrongAnswerPenalty < 0.0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "wrong answer penalty must not be negative");
    }
}

QuestionStatus ScoringEngine::statusFor(const Response* response, int correctOption) {
    if (!response || response->kind == Response::None) return QuestionStatus::NotAttempted;
    if (response->kind == Response::Ambiguous) return QuestionStatus::MultipleMarked;
    return response->options.front() == correctOption ? QuestionStatus::Correct
                                                      : QuestionStatus::Incorrect;
}

ScoreReport ScoringEngine::score(const Responses& responses,
                                 const AnswerKey& key,
                                 const std::vector<SubjectRange>& subjects) const
{
    if (!subjects.empty()) {
        int lastCovered = 0;
        for (const auto& s : subjects) lastCovered = std::max(lastCovered, s.last);
        validateSubjectRanges(subjects, lastCovered);

        for (const auto& [question, option] : key.answers()) {
            (void)option;
            if (question > lastCovered) {
                throw OmrError(ErrorKind::ConfigurationError, Stage::Score,
                               "question " + std::to_string(question) +
                               " is not covered by any subject range");
            }
        }
    }

    ScoreReport report;
    for (const auto& s : subjects) {
        SubjectScore ss;
        ss.name = s.name;
        ss.first = s.first;
        ss.last = s.last;
        report.subjects.push_back(ss);
    }

    for (const auto& [question, correct] : key.answers()) {
        auto it = responses.find(question);
        const Response* resp = it == responses.end() ? nullptr : &it->second;

        QuestionResult qr;
        qr.questionNumber = question;
        qr.correctOption = correct;
        qr.status = statusFor(resp, correct);
        if (resp) qr.selected = resp->options;

        report.totalQuestions++;
        switch (qr.status) {
        case QuestionStatus::Correct:        report.correctCount++; break;
        case QuestionStatus::Incorrect:      report.incorrectCount++; break;
        case QuestionStatus::NotAttempted:   report.notAttemptedCount++; break;
        case QuestionStatus::MultipleMarked: report.multipleMarkedCount++; break;
        }

        for (auto& ss : report.subjects) {
            if (question >= ss.first && question <= ss.last) {
                ss.total++;
                if (qr.status == QuestionStatus::Correct) ss.correct++;
                break;
            }
        }

        report.results.push_back(std::move(qr));
    }

    report.percentage = percentOf(report.correctCount, report.totalQuestions);
    report.netScore = report.correctCount - report.incorrectCount * policy_.wrongAnswerPenalty;
    for (auto& ss : report.subjects) ss.percentage = percentOf(ss.correct, ss.total);

    spdlog::debug("scoring: {}/{} correct, {} incorrect, {} blank, {} multiple",
                  report.correctCount, report.totalQuestions, report.incorrectCount,
                  report.notAttemptedCount, report.multipleMarkedCount);
    return report;
}

std::string formatSummary(const ScoreReport& report) {
    std::ostringstream ss;
    ss << std::string(50, '=') << "\n";
    ss << "OMR EVALUATION SUMMARY\n";
    ss << std::string(50, '=') << "\n";
    ss << "Total Questions: " << report.totalQuestions << "\n";
    ss << "Correct: " << report.correctCount << "\n";
    ss << "Incorrect: " << report.incorrectCount << "\n";
    ss << "Not Attempted: " << report.notAttemptedCount << "\n";
    ss << "Multiple Marked: " << report.multipleMarkedCount << "\n";
    ss << "Score: " << std::fixed << std::setprecision(2) << report.percentage << "%"
       << " (net " << report.netScore << ")\n";

    if (!report.subjects.empty()) {
        ss << "\nSUBJECTS:\n" << std::string(30, '-') << "\n";
        for (const auto& s : report.subjects) {
            ss << s.name << " [" << s.first << "-" << s.last << "]: "
               << s.correct << "/" << s.total << " ("
               << std::setprecision(1) << s.percentage << "%)\n";
        }
    }

    bool header = false;
    for (const auto& q : report.results) {
        if (q.status == QuestionStatus::Correct) continue;
        if (!header) {
            ss << "\nQUESTIONS NOT CORRECT:\n";
            header = true;
        }
        ss << "  Q" << q.questionNumber << ": " << optionLetters(q.selected)
           << " -> " << optionLetters({q.correctOption}) << " (" << toCStr(q.status) << ")\n";
    }
    ss << std::string(50, '=') << "\n";
    return ss.str();
}

} // namespace omr
