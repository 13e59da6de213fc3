#include "omr/Binarizer.hpp"
#include "omr/Types.hpp"
#include <opencv2/photo.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <vector>

namespace omr {

namespace {

constexpr double kDegPerRad = 180.0 / CV_PI;

}

Binarizer::Binarizer(const BinarizerParams& params)
    : params_(params)
{
    if (params_.windowSize < 3 || params_.windowSize % 2 == 0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "adaptive threshold window must be odd and >= 3, got " +
                       std::to_string(params_.windowSize));
    }
    if (params_.blurKernel != 0 && (params_.blurKernel < 3 || params_.blurKernel % 2 == 0)) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "blur kernel must be 0 or odd and >= 3, got " +
                       std::to_string(params_.blurKernel));
    }
    if (params_.clahe && (params_.claheClipLimit <= 0.0 || params_.claheTileGrid < 1)) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "CLAHE needs a positive clip limit and tile grid");
    }
    if (params_.minSkewDegrees < 0.0) {
        throw OmrError(ErrorKind::ConfigurationError, Stage::Configure,
                       "minimum skew must not be negative");
    }
}

cv::Mat Binarizer::toGray(const cv::Mat& image) {
    cv::Mat src = image;
    if (src.depth() != CV_8U) {
        double scale = 1.0;
        if (src.depth() == CV_16U) scale = 1.0 / 257.0;
        else if (src.depth() == CV_32F || src.depth() == CV_64F) scale = 255.0;
        src.convertTo(src, CV_8U, scale);
    }

    cv::Mat gray;
    switch (src.channels()) {
    case 1:
        gray = src;
        break;
    case 3:
        cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY);
        break;
    case 4:
        cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
        throw OmrError(ErrorKind::DecodeError, Stage::Binarize,
                       "unsupported channel count " + std::to_string(src.channels()));
    }
    return gray;
}

double Binarizer::skewCorrection(const cv::Mat& gray) {
    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150, 3);

    std::vector<cv::Vec2f> lines;
    cv::HoughLines(edges, lines, 1, CV_PI / 180, 100);

    std::vector<double> deviations;
    deviations.reserve(lines.size());
    for (const auto& l : lines) {
        double theta = l[1] * kDegPerRad;
        if (theta < 45.0) deviations.push_back(theta);
        else if (theta > 135.0) deviations.push_back(theta - 180.0);
        else deviations.push_back(theta - 90.0);
    }
    if (deviations.empty()) return 0.0;

    size_t mid = deviations.size() / 2;
    std::nth_element(deviations.begin(), deviations.begin() + mid, deviations.end());
    double med = deviations[mid];
    if (deviations.size() % 2 == 0) {
        med = 0.5 * (med + *std::max_element(deviations.begin(), deviations.begin() + mid));
    }
    spdlog::debug("deskew: {} lines, median deviation {:.2f} deg", lines.size(), med);
    return med;
}

cv::Mat Binarizer::rotate(const cv::Mat& gray, double degrees) {
    cv::Point2f center(gray.cols / 2.f, gray.rows / 2.f);
    cv::Mat rot = cv::getRotationMatrix2D(center, degrees, 1.0);
    cv::Mat out;
    cv::warpAffine(gray, out, rot, gray.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    return out;
}

cv::Mat Binarizer::condition(const cv::Mat& image) const {
    if (image.empty()) {
        throw OmrError(ErrorKind::DecodeError, Stage::Binarize, "empty image");
    }

    // gray may share data with the caller's image, so every step writes a new Mat
    cv::Mat gray = toGray(image);

    if (params_.clahe) {
        cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
            params_.claheClipLimit, cv::Size(params_.claheTileGrid, params_.claheTileGrid));
        cv::Mat equalized;
        clahe->apply(gray, equalized);
        gray = equalized;
    }
    if (params_.denoise) {
        cv::Mat denoised;
        cv::fastNlMeansDenoising(gray, denoised);
        gray = denoised;
    }
    if (params_.deskew) {
        double angle = skewCorrection(gray);
        if (std::abs(angle) > params_.minSkewDegrees) {
            spdlog::debug("deskew: rotating by {:.2f} deg", angle);
            gray = rotate(gray, angle);
        }
    }
    if (params_.blurKernel > 0) {
        cv::Mat blurred;
        cv::GaussianBlur(gray, blurred, cv::Size(params_.blurKernel, params_.blurKernel), 0);
        gray = blurred;
    }
    return gray;
}

cv::Mat Binarizer::threshold(const cv::Mat& gray) const {
    int method = params_.method == BinarizerParams::Gaussian
        ? cv::ADAPTIVE_THRESH_GAUSSIAN_C
        : cv::ADAPTIVE_THRESH_MEAN_C;

    cv::Mat mask;
    cv::adaptiveThreshold(gray, mask, 255, method, cv::THRESH_BINARY_INV,
                          params_.windowSize, params_.bias);

    spdlog::debug("binarize: {}x{} window={} bias={} ink={}",
                  mask.cols, mask.rows, params_.windowSize, params_.bias, cv::countNonZero(mask));
    return mask;
}

cv::Mat Binarizer::binarize(const cv::Mat& image) const {
    return threshold(condition(image));
}

} // namespace omr
