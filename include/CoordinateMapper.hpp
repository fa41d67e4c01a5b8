#pragma once

#include "CurveTypes.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace CurveTrace {

class CoordinateMapper {
public:
    // Throws CalibrationError unless max > min on both axes (and min > 0 on log axes).
    static void validateCalibration(const AxisCalibration& calibration);

    static double mapX(double px, int canvasWidth, const AxisCalibration& calibration);
    static double mapY(double py, int canvasHeight, const AxisCalibration& calibration);
    static CurvePoint mapPixel(const cv::Point& pixel, const cv::Size& canvasSize,
                               const AxisCalibration& calibration);

    // Every non-zero pixel of the mask, in row-major order.
    static std::vector<CurvePoint> mapMask(const cv::Mat& mask, const AxisCalibration& calibration);
};

} // namespace CurveTrace
