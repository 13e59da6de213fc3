#ifndef OMR_SAMPLE_SHEET_HPP
#define OMR_SAMPLE_SHEET_HPP

#include "omr/AnswerKey.hpp"
#include "omr/Layout.hpp"
#include <opencv2/opencv.hpp>
#include <map>
#include <vector>

namespace omr {

// question -> options filled in by the respondent
using SheetMarks = std::map<int, std::vector<int>>;

struct SheetStyle {
    int radius = 10;
    int outline = 2;
    int optionSpacing = 30;   // center to center inside a question
    int blockGap = 40;        // extra space between column blocks
    int rowSpacing = 34;
    int margin = 40;
    double gradient = 0.0;    // 0..0.8, darkens the page from left to right
    bool rules = false;       // printed lines across the top and bottom margins
};

// Renders blank or marked bubble sheets that follow a Layout.
class SampleSheet {
public:
    static cv::Mat render(const Layout& layout, const SheetMarks& marks = {},
                          const SheetStyle& style = SheetStyle());

    static cv::Size pageSize(const Layout& layout, const SheetStyle& style = SheetStyle());

    static cv::Point bubbleCenter(const Layout& layout, const SheetStyle& style,
                                  int block, int row, int option);

    // One filled bubble per keyed question, on the correct option.
    static SheetMarks marksFromKey(const AnswerKey& key);
};

} // namespace omr

#endif // OMR_SAMPLE_SHEET_HPP
