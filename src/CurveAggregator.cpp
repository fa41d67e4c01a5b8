#include "CurveAggregator.hpp"
#include <opencv2/core.hpp>
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <numeric>
#include <cmath>

using namespace cv;
using namespace std;

namespace CurveTrace {

map<long long, vector<double>> CurveAggregator::binPoints(const vector<CurvePoint>& points, double binWidth) {
    if (binWidth <= 0.0) {
        throw invalid_argument("Bin width must be positive");
    }

    map<long long, vector<double>> bins;
    for (const auto& point : points) {
        // Round half to even, as the default floating point environment does
        long long index = static_cast<long long>(nearbyint(point.x / binWidth));
        bins[index].push_back(point.y);
    }
    return bins;
}

double CurveAggregator::median(vector<double> values) {
    if (values.empty()) {
        throw invalid_argument("Median of an empty set");
    }

    size_t mid = values.size() / 2;
    nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

bool CurveAggregator::reduceBin(const vector<double>& yValues, const AggregationParams& params, double& value) {
    if (yValues.empty()) return false;

    double med = median(yValues);

    vector<double> deviations;
    deviations.reserve(yValues.size());
    for (double y : yValues) {
        deviations.push_back(fabs(y - med));
    }
    double mad = median(deviations) + params.madEpsilon;

    vector<double> kept;
    for (double y : yValues) {
        if (fabs(y - med) < params.madMultiplier * mad) {
            kept.push_back(y);
        }
    }
    if (kept.empty()) return false;

    double mean = accumulate(kept.begin(), kept.end(), 0.0) / static_cast<double>(kept.size());
    double sqSum = 0.0;
    for (double y : kept) {
        sqSum += (y - mean) * (y - mean);
    }
    double stdDev = sqrt(sqSum / static_cast<double>(kept.size()));
    if (stdDev > params.maxBinStdDev) return false;

    value = mean;
    return true;
}

vector<double> CurveAggregator::smoothValues(const vector<double>& values, int window, int polyOrder) {
    if (polyOrder < 0 || window <= polyOrder) {
        throw invalid_argument("Smoothing window (" + to_string(window) +
                               ") must exceed the polynomial order (" + to_string(polyOrder) + ")");
    }

    const int n = static_cast<int>(values.size());
    if (n <= window) {
        return values;
    }

    const int half = window / 2;
    vector<double> smoothed(n);

    Mat A(window, polyOrder + 1, CV_64F);
    Mat b(window, 1, CV_64F);
    Mat coeffs;

    for (int i = 0; i < n; i++) {
        int start = min(max(i - half, 0), n - window);

        for (int k = 0; k < window; k++) {
            // Abscissa relative to the evaluated sample, so the fit at i is the constant term
            double t = static_cast<double>(start + k - i);
            double term = 1.0;
            for (int p = 0; p <= polyOrder; p++) {
                A.at<double>(k, p) = term;
                term *= t;
            }
            b.at<double>(k, 0) = values[start + k];
        }

        if (!solve(A, b, coeffs, DECOMP_QR)) {
            throw runtime_error("Local polynomial fit failed at sample " + to_string(i));
        }
        smoothed[i] = coeffs.at<double>(0, 0);
    }
    return smoothed;
}

CurveSeries CurveAggregator::aggregate(const string& baseColor,
                                       const vector<CurvePoint>& points,
                                       int smoothingWindow,
                                       const AggregationParams& params) {
    CurveSeries series;
    series.baseColor = baseColor;
    series.label = baseColor;

    auto bins = binPoints(points, params.binWidth);

    vector<double> xs, ys;
    int dropped = 0;
    for (const auto& [index, yValues] : bins) {
        double value = 0.0;
        if (!reduceBin(yValues, params, value)) {
            dropped++;
            continue;
        }
        xs.push_back(static_cast<double>(index) * params.binWidth);
        ys.push_back(value);
    }

    cout << "[INFO] " << baseColor << ": " << xs.size() << " bins kept, "
         << dropped << " dropped as too dispersed" << endl;

    // std::map iterates in ascending bin order; the sort makes the x ordering explicit
    vector<size_t> order(xs.size());
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return xs[a] < xs[b]; });

    vector<double> sortedY;
    sortedY.reserve(order.size());
    series.points.reserve(order.size());
    for (size_t idx : order) {
        series.points.push_back(CurvePoint{xs[idx], ys[idx]});
        sortedY.push_back(ys[idx]);
    }

    if (static_cast<int>(sortedY.size()) > smoothingWindow) {
        vector<double> smoothY = smoothValues(sortedY, smoothingWindow, params.polyOrder);
        for (size_t i = 0; i < series.points.size(); i++) {
            series.points[i].y = smoothY[i];
        }
        cout << "[INFO] " << baseColor << ": smoothed with window " << smoothingWindow << endl;
    }

    return series;
}

} // namespace CurveTrace
