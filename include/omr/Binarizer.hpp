#ifndef OMR_BINARIZER_HPP
#define OMR_BINARIZER_HPP

#include <opencv2/opencv.hpp>

namespace omr {

struct BinarizerParams {
    enum Method {
        Mean,
        Gaussian
    };

    int windowSize = 21;     // odd, >= 3
    double bias = 10.0;      // subtracted from the local mean
    Method method = Mean;
    int blurKernel = 0;      // 0 disables the pre-blur

    // Optional conditioning, applied in this order before thresholding.
    bool clahe = false;
    double claheClipLimit = 2.0;
    int claheTileGrid = 8;
    bool denoise = false;
    bool deskew = false;
    double minSkewDegrees = 0.5;   // smaller estimates leave the page as is
};

class Binarizer {
public:
    explicit Binarizer(const BinarizerParams& params = BinarizerParams());

    // Ink (dark) pixels become 255, background 0.
    cv::Mat binarize(const cv::Mat& image) const;

    // Grayscale plane after CLAHE, denoising, deskew and blur as configured.
    cv::Mat condition(const cv::Mat& image) const;

    // Adaptive threshold of an already conditioned 8-bit plane.
    cv::Mat threshold(const cv::Mat& gray) const;

    // 8-bit single channel. Float input is taken to be in [0, 1].
    static cv::Mat toGray(const cv::Mat& image);

    // Rotation in degrees (counter-clockwise positive, as cv::getRotationMatrix2D)
    // that straightens the dominant line structure; 0 when no line is found.
    static double skewCorrection(const cv::Mat& gray);

    static cv::Mat rotate(const cv::Mat& gray, double degrees);

    const BinarizerParams& params() const { return params_; }

private:
    BinarizerParams params_;
};

} // namespace omr

#endif // OMR_BINARIZER_HPP
