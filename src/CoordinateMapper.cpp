#include "CoordinateMapper.hpp"
#include <iostream>
#include <sstream>
#include <cmath>

using namespace cv;
using namespace std;

namespace CurveTrace {

namespace {

    // f in [0, 1] along the axis from min to max
    double interpolate(double f, double minVal, double maxVal, ScaleType scaleType) {
        if (scaleType == ScaleType::Log) {
            double logMin = log10(minVal);
            double logMax = log10(maxVal);
            return pow(10.0, logMin + f * (logMax - logMin));
        }
        return f * (maxVal - minVal) + minVal;
    }

    void validateAxis(const char* axis, double minVal, double maxVal, ScaleType scaleType) {
        if (!std::isfinite(minVal) || !std::isfinite(maxVal) || maxVal <= minVal) {
            ostringstream msg;
            msg << "Invalid " << axis << "-axis range: " << axis << "_max (" << maxVal
                << ") must be greater than " << axis << "_min (" << minVal << ")";
            throw CalibrationError(msg.str());
        }
        if (scaleType == ScaleType::Log && minVal <= 0.0) {
            ostringstream msg;
            msg << "Invalid " << axis << "-axis range: logarithmic axis requires "
                << axis << "_min > 0, got " << minVal;
            throw CalibrationError(msg.str());
        }
    }
}

void CoordinateMapper::validateCalibration(const AxisCalibration& calibration) {
    validateAxis("x", calibration.xMin, calibration.xMax, calibration.xScaleType);
    validateAxis("y", calibration.yMin, calibration.yMax, calibration.yScaleType);
}

double CoordinateMapper::mapX(double px, int canvasWidth, const AxisCalibration& calibration) {
    double f = px / static_cast<double>(canvasWidth);
    return interpolate(f, calibration.xMin, calibration.xMax, calibration.xScaleType);
}

double CoordinateMapper::mapY(double py, int canvasHeight, const AxisCalibration& calibration) {
    // Canvas origin is top-left, graph origin is bottom-left
    double f = (static_cast<double>(canvasHeight) - py) / static_cast<double>(canvasHeight);
    return interpolate(f, calibration.yMin, calibration.yMax, calibration.yScaleType);
}

CurvePoint CoordinateMapper::mapPixel(const Point& pixel, const Size& canvasSize, const AxisCalibration& calibration) {
    return CurvePoint{mapX(pixel.x, canvasSize.width, calibration),
                      mapY(pixel.y, canvasSize.height, calibration)};
}

vector<CurvePoint> CoordinateMapper::mapMask(const Mat& mask, const AxisCalibration& calibration) {
    if (mask.empty() || mask.type() != CV_8UC1) {
        throw invalid_argument("Coordinate mapping requires a non-empty single-channel 8-bit mask");
    }

    vector<Point> pixels;
    findNonZero(mask, pixels);

    vector<CurvePoint> points;
    points.reserve(pixels.size());
    for (const Point& pixel : pixels) {
        points.push_back(mapPixel(pixel, mask.size(), calibration));
    }

    cout << "[DEBUG] Mapped " << points.size() << " pixels to logical coordinates" << endl;
    return points;
}

} // namespace CurveTrace
