#ifndef OMR_ANSWER_KEY_HPP
#define OMR_ANSWER_KEY_HPP

#include <map>
#include <string>
#include <vector>

namespace omr {

class AnswerKey {
public:
    struct QuestionAnswer {
        int questionNumber;   // 1-based
        int correctOption;    // 0-based: A = 0, B = 1, ...
    };

    AnswerKey() = default;
    explicit AnswerKey(const std::vector<QuestionAnswer>& answers);

    // "BACD-A": one letter per question starting at firstQuestion, '-' leaves a gap.
    static AnswerKey fromLetters(const std::string& letters, int firstQuestion = 1);

    bool contains(int questionNumber) const;
    int correctOption(int questionNumber) const;   // -1 when absent

    size_t size() const { return answers_.size(); }
    bool empty() const { return answers_.empty(); }
    const std::map<int, int>& answers() const { return answers_; }
    std::vector<int> questions() const;   // ascending

private:
    std::map<int, int> answers_;
};

} // namespace omr

#endif // OMR_ANSWER_KEY_HPP
