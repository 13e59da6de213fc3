#include "omr/Layout.hpp"
#include <algorithm>
#include <sstream>

namespace omr {

namespace {

[[noreturn]] void configError(const std::string& msg) {
    throw OmrError(ErrorKind::ConfigurationError, Stage::Configure, msg);
}

}

const char* toCStr(NumberingScheme scheme) {
    switch (scheme) {
    case NumberingScheme::BlockMajor: return "block_major";
    case NumberingScheme::RowMajor:   return "row_major";
    default:                          return "unknown";
    }
}

Layout Layout::standard() {
    Layout l;
    l.totalQuestions = 100;
    l.optionsPerQuestion = 4;
    l.rowsPerBlock = 20;
    l.columnBlocks = 5;
    l.numbering = NumberingScheme::BlockMajor;
    return l;
}

void Layout::validate() const {
    if (totalQuestions <= 0 || rowsPerBlock <= 0 || columnBlocks <= 0) {
        std::ostringstream oss;
        oss << "layout counts must be positive (questions=" << totalQuestions
            << ", rows=" << rowsPerBlock << ", blocks=" << columnBlocks << ")";
        configError(oss.str());
    }
    if (optionsPerQuestion < 2) {
        configError("layout needs at least 2 options per question, got " +
                    std::to_string(optionsPerQuestion));
    }
    if (totalQuestions != rowsPerBlock * columnBlocks) {
        std::ostringstream oss;
        oss << "total_questions " << totalQuestions << " does not factor into "
            << rowsPerBlock << " rows x " << columnBlocks << " blocks";
        configError(oss.str());
    }
    if (!subjects.empty()) {
        validateSubjectRanges(subjects, totalQuestions);
    }
}

int Layout::questionNumber(int block, int row) const {
    if (numbering == NumberingScheme::RowMajor) {
        return row * columnBlocks + block + 1;
    }
    return block * rowsPerBlock + row + 1;
}

const SubjectRange* Layout::subjectFor(int q) const {
    for (const auto& s : subjects) {
        if (q >= s.first && q <= s.last) return &s;
    }
    return nullptr;
}

void validateSubjectRanges(const std::vector<SubjectRange>& subjects, int totalQuestions) {
    if (subjects.empty()) return;

    std::vector<SubjectRange> sorted = subjects;
    std::sort(sorted.begin(), sorted.end(), [](const SubjectRange& a, const SubjectRange& b) {
        return a.first < b.first;
    });

    int expectedFirst = 1;
    for (const auto& s : sorted) {
        if (s.last < s.first) {
            configError("subject '" + s.name + "' has an inverted range " +
                        std::to_string(s.first) + ".." + std::to_string(s.last));
        }
        if (s.first < expectedFirst) {
            configError("subject '" + s.name + "' overlaps a previous range at question " +
                        std::to_string(s.first));
        }
        if (s.first > expectedFirst) {
            configError("subject ranges leave questions " + std::to_string(expectedFirst) + ".." +
                        std::to_string(s.first - 1) + " uncovered");
        }
        expectedFirst = s.last + 1;
    }

    if (expectedFirst - 1 != totalQuestions) {
        std::ostringstream oss;
        oss << "subject ranges cover 1.." << (expectedFirst - 1)
            << " but the sheet has " << totalQuestions << " questions";
        configError(oss.str());
    }
}

} // namespace omr
