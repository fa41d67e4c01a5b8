#pragma once

#include "CurveTypes.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace CurveTrace {

class ColorSegmenter {
public:
    struct ColorMask {
        std::string name;
        std::string baseColor;
        cv::Mat mask;  // CV_8UC1, 255 where the pixel falls inside the color's HSV range
    };

    // Pixel count and average color of one spec, as reported by surveyColors
    struct ColorPresence {
        std::string name;
        std::string baseColor;
        int pixelCount = 0;
        std::string hexColor;
        double confidence = 0.0;
    };

    static cv::Mat convertToHSV(const cv::Mat& bgrImg);
    static cv::Mat thresholdSpec(const cv::Mat& hsvImg, const ColorSpec& spec);

    // One mask per spec, in spec order.
    static std::vector<ColorMask> segment(const cv::Mat& canvas, const std::vector<ColorSpec>& specs);

    static std::vector<ColorPresence> surveyColors(const cv::Mat& bgrImg,
                                                   const std::vector<ColorSpec>& specs,
                                                   int minPixels = 500);
};

} // namespace CurveTrace
