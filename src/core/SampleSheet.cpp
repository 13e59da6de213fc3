#include "omr/SampleSheet.hpp"
#include <algorithm>

namespace omr {

cv::Size SampleSheet::pageSize(const Layout& layout, const SheetStyle& style) {
    int blockW = layout.optionsPerQuestion * style.optionSpacing;
    int w = 2 * style.margin + layout.columnBlocks * blockW + (layout.columnBlocks - 1) * style.blockGap;
    int h = 2 * style.margin + layout.rowsPerBlock * style.rowSpacing;
    return cv::Size(w, h);
}

cv::Point SampleSheet::bubbleCenter(const Layout& layout, const SheetStyle& style,
                                    int block, int row, int option) {
    int blockW = layout.optionsPerQuestion * style.optionSpacing + style.blockGap;
    int x = style.margin + block * blockW + option * style.optionSpacing + style.optionSpacing / 2;
    int y = style.margin + row * style.rowSpacing + style.rowSpacing / 2;
    return cv::Point(x, y);
}

cv::Mat SampleSheet::render(const Layout& layout, const SheetMarks& marks, const SheetStyle& style) {
    layout.validate();

    cv::Mat page(pageSize(layout, style), CV_8UC1, cv::Scalar(255));

    for (int block = 0; block < layout.columnBlocks; ++block) {
        for (int row = 0; row < layout.rowsPerBlock; ++row) {
            int q = layout.questionNumber(block, row);
            auto it = marks.find(q);

            for (int opt = 0; opt < layout.optionsPerQuestion; ++opt) {
                cv::Point c = bubbleCenter(layout, style, block, row, opt);
                bool filled = it != marks.end() &&
                    std::find(it->second.begin(), it->second.end(), opt) != it->second.end();

                if (filled) {
                    cv::circle(page, c, style.radius, cv::Scalar(0), cv::FILLED);
                } else {
                    cv::circle(page, c, style.radius, cv::Scalar(0), style.outline);
                }
            }
        }
    }

    if (style.rules) {
        int x0 = style.margin / 2;
        int x1 = page.cols - style.margin / 2;
        for (int y : {style.margin / 2, page.rows - style.margin / 2}) {
            cv::line(page, cv::Point(x0, y), cv::Point(x1, y), cv::Scalar(0), 2);
        }
    }

    if (style.gradient > 0.0) {
        double g = std::min(style.gradient, 0.8);
        for (int y = 0; y < page.rows; ++y) {
            uchar* p = page.ptr<uchar>(y);
            for (int x = 0; x < page.cols; ++x) {
                double k = 1.0 - g * x / page.cols;
                p[x] = cv::saturate_cast<uchar>(p[x] * k);
            }
        }
    }

    cv::Mat bgr;
    cv::cvtColor(page, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

SheetMarks SampleSheet::marksFromKey(const AnswerKey& key) {
    SheetMarks marks;
    for (const auto& [q, opt] : key.answers()) marks[q] = {opt};
    return marks;
}

} // namespace omr
