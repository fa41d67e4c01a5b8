#pragma once

#include "CurveTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace CurveTrace {

class CurveAggregator {
public:
    struct AggregationParams {
        double binWidth      = 0.01;  // logical x units
        double madEpsilon    = 1e-6;
        double madMultiplier = 2.0;   // keep |y - median| < madMultiplier * MAD
        double maxBinStdDev  = 0.3;   // bins more dispersed than this are dropped
        int polyOrder        = 3;     // local fit degree used for smoothing
    };

    // Bin index -> collected y values. Bin i is centered on i * binWidth.
    static std::map<long long, std::vector<double>> binPoints(const std::vector<CurvePoint>& points,
                                                              double binWidth);

    static double median(std::vector<double> values);

    // Robust mean of one bin. Returns false when the bin must be dropped.
    static bool reduceBin(const std::vector<double>& yValues, const AggregationParams& params, double& value);

    // Local least-squares polynomial fit over `window` consecutive samples.
    // Edge samples are evaluated on the first/last full window.
    static std::vector<double> smoothValues(const std::vector<double>& values, int window, int polyOrder);

    static CurveSeries aggregate(const std::string& baseColor,
                                 const std::vector<CurvePoint>& points,
                                 int smoothingWindow,
                                 const AggregationParams& params);
};

} // namespace CurveTrace
