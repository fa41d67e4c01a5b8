#pragma once

#include "CurveTypes.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace CurveTrace {

class ImageNormalizer {
public:
    struct NormalizerParams {
        // Rectified canvas dimensions
        int canvasSize = 1000;

        // Edge detection parameters
        double cannyLower = 50.0;
        double cannyUpper = 150.0;
        int cannyAperture = 3;

        // Polygon approximation of the plot boundary
        double polygonEpsilonFactor = 0.02;

        // Frequency-domain grid estimate
        int spectrumCropRadius = 100;
        double peakPercentile  = 99.5;
        int defaultGridSize    = 10;
        int minGridSize        = 5;
        int maxGridSize        = 50;
    };

    struct NormalizedCanvas {
        cv::Mat canvas;                      // BGR, canvasSize x canvasSize
        cv::Mat transform;                   // 3x3 CV_64F, source -> canvas
        std::vector<cv::Point2f> corners;    // TL, TR, BR, BL in source pixels
        int gridSize = 10;
    };

    static cv::Mat loadImage(const std::string& path);
    static cv::Mat convertToBGR(const cv::Mat& img);
    static cv::Mat convertToGrayscale(const cv::Mat& img);
    static cv::Mat detectEdges(const cv::Mat& grayImg, const NormalizerParams& params);
    static std::vector<cv::Point> findLargestContour(const cv::Mat& edgeImg);
    static std::vector<cv::Point> approximatePolygon(const std::vector<cv::Point>& contour,
                                                     double epsilonFactor = 0.02);

    // Grayscale -> edges -> largest external contour -> 4-vertex polygon.
    // Throws GridDetectionError when the polygon has any other vertex count.
    static std::vector<cv::Point2f> detectGridCorners(const cv::Mat& bgrImg, const NormalizerParams& params);

    // TL = min(x+y), BR = max(x+y), TR = min(y-x), BL = max(y-x).
    // Sum ties go to the smaller y, difference ties to the larger x.
    // Throws GridDetectionError when two roles land on the same vertex.
    static std::vector<cv::Point2f> orderCorners(const std::vector<cv::Point2f>& corners);

    static cv::Mat computeTransform(const std::vector<cv::Point2f>& orderedCorners, const cv::Size& canvasSize);
    static cv::Mat warpImage(const cv::Mat& img, const cv::Mat& transform, const cv::Size& canvasSize);

    // Diagnostic only; nothing downstream consumes it.
    static int estimateGridSize(const cv::Mat& canvas, const NormalizerParams& params);

    static NormalizedCanvas normalize(const cv::Mat& img, const NormalizerParams& params);
};

} // namespace CurveTrace
