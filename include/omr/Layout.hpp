#ifndef OMR_LAYOUT_HPP
#define OMR_LAYOUT_HPP

#include "omr/Types.hpp"
#include <string>
#include <vector>

namespace omr {

enum class NumberingScheme {
    BlockMajor,   // block 0 holds 1..rowsPerBlock, block 1 the next rowsPerBlock, ...
    RowMajor      // row 0 holds 1..columnBlocks, row 1 the next columnBlocks, ...
};

const char* toCStr(NumberingScheme scheme);

struct SubjectRange {
    std::string name;
    int first;    // inclusive, 1-based
    int last;     // inclusive
};

struct Layout {
    int totalQuestions = 0;
    int optionsPerQuestion = 0;
    int rowsPerBlock = 0;
    int columnBlocks = 0;
    NumberingScheme numbering = NumberingScheme::BlockMajor;
    std::vector<SubjectRange> subjects;

    // 100 questions in 5 blocks of 20 rows, 4 options each.
    static Layout standard();

    // Throws OmrError(ConfigurationError) on an inconsistent layout.
    void validate() const;

    int cellCount() const { return totalQuestions * optionsPerQuestion; }
    int bubblesPerRow() const { return optionsPerQuestion * columnBlocks; }

    int questionNumber(int block, int row) const;

    // nullptr when no subject covers the question.
    const SubjectRange* subjectFor(int questionNumber) const;
};

// Checks that the ranges tile [1, totalQuestions] exactly.
void validateSubjectRanges(const std::vector<SubjectRange>& subjects, int totalQuestions);

} // namespace omr

#endif // OMR_LAYOUT_HPP
