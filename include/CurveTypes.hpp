#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace CurveTrace {

enum class ScaleType {
    Linear,
    Log
};

// Logical axis bounds of the plot area. The bottom-left canvas corner is
// (xMin, yMin) and the top-right corner is (xMax, yMax).
struct AxisCalibration {
    double xMin = 0.0;
    double xMax = 10.0;
    double yMin = 0.0;
    double yMax = 100.0;
    ScaleType xScaleType = ScaleType::Linear;
    ScaleType yScaleType = ScaleType::Linear;
};

// Inclusive HSV range (OpenCV hue scale 0..180) for one raw color class.
struct ColorSpec {
    std::string name;
    cv::Scalar lower;
    cv::Scalar upper;
    std::string baseColor;
};

struct CurvePoint {
    double x = 0.0;
    double y = 0.0;
};

struct CurveSeries {
    std::string baseColor;
    std::vector<CurvePoint> points;  // non-decreasing x
    std::string label;
};

struct ExtractionResult {
    std::map<std::string, CurveSeries> curves;  // keyed by base color
    AxisCalibration calibration;
    int gridSize = 10;

    // Filled only when ExtractionConfig::keepDebugImages is set
    cv::Mat canvas;
    std::map<std::string, cv::Mat> cleanedMasks;
};

// The plot boundary could not be resolved to exactly four corners.
class GridDetectionError : public std::runtime_error {
public:
    explicit GridDetectionError(const std::string& what) : std::runtime_error(what) {}
};

// Axis bounds are inverted, empty or not representable on the requested scale.
class CalibrationError : public std::invalid_argument {
public:
    explicit CalibrationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace CurveTrace
