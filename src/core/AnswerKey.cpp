#include "omr/AnswerKey.hpp"
#include "omr/Types.hpp"
#include <cctype>

namespace omr {

AnswerKey::AnswerKey(const std::vector<QuestionAnswer>& answers) {
    for (const auto& a : answers) {
        if (a.questionNumber < 1) {
            throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                           "answer key question numbers start at 1, got " +
                           std::to_string(a.questionNumber));
        }
        if (a.correctOption < 0) {
            throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                           "answer key option for question " + std::to_string(a.questionNumber) +
                           " is negative");
        }
        if (!answers_.emplace(a.questionNumber, a.correctOption).second) {
            throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                           "question " + std::to_string(a.questionNumber) +
                           " appears twice in the answer key");
        }
    }
}

AnswerKey AnswerKey::fromLetters(const std::string& letters, int firstQuestion) {
    std::vector<QuestionAnswer> answers;
    int q = firstQuestion;
    for (char ch : letters) {
        if (std::isspace((unsigned char)ch) || ch == ',') continue;
        if (ch != '-') {
            char up = (char)std::toupper((unsigned char)ch);
            if (up < 'A' || up > 'Z') {
                throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                               std::string("invalid answer letter '") + ch + "'");
            }
            answers.push_back({q, up - 'A'});
        }
        q++;
    }
    return AnswerKey(answers);
}

bool AnswerKey::contains(int questionNumber) const {
    return answers_.find(questionNumber) != answers_.end();
}

int AnswerKey::correctOption(int questionNumber) const {
    auto it = answers_.find(questionNumber);
    return it == answers_.end() ? -1 : it->second;
}

std::vector<int> AnswerKey::questions() const {
    std::vector<int> out;
    out.reserve(answers_.size());
    for (const auto& qa : answers_) out.push_back(qa.first);
    return out;
}

} // namespace omr
