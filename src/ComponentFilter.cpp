#include "ComponentFilter.hpp"
#include <iostream>
#include <stdexcept>
#include <algorithm>

using namespace cv;
using namespace std;

namespace CurveTrace {

vector<pair<string, Mat>> ComponentFilter::mergeByBaseColor(const vector<ColorSegmenter::ColorMask>& masks) {
    vector<pair<string, Mat>> merged;

    for (const auto& colorMask : masks) {
        auto it = find_if(merged.begin(), merged.end(), [&](const pair<string, Mat>& entry) {
            return entry.first == colorMask.baseColor;
        });

        if (it == merged.end()) {
            merged.emplace_back(colorMask.baseColor, colorMask.mask.clone());
        } else {
            if (it->second.size() != colorMask.mask.size()) {
                throw invalid_argument("Masks for base color " + colorMask.baseColor + " differ in size");
            }
            bitwise_or(it->second, colorMask.mask, it->second);
        }
    }
    return merged;
}

Mat ComponentFilter::morphologicalOpen(const Mat& mask, const FilterParams& params) {
    Mat kernel = getStructuringElement(MORPH_RECT, Size(params.morphKernelSize, params.morphKernelSize));
    Mat opened;
    morphologyEx(mask, opened, MORPH_OPEN, kernel);
    return opened;
}

Mat ComponentFilter::removeSmallComponents(const Mat& mask, int minArea, const FilterParams& params) {
    Mat labels, stats, centroids;
    int numComponents = connectedComponentsWithStats(mask, labels, stats, centroids, params.connectivity);

    // Label 0 is the background
    vector<uchar> keep(numComponents, 0);
    int kept = 0;
    for (int i = 1; i < numComponents; i++) {
        if (stats.at<int>(i, CC_STAT_AREA) >= minArea) {
            keep[i] = 255;
            kept++;
        }
    }

    Mat filtered = Mat::zeros(mask.size(), CV_8UC1);
    for (int r = 0; r < labels.rows; r++) {
        const int* labelRow = labels.ptr<int>(r);
        uchar* outRow = filtered.ptr<uchar>(r);
        for (int c = 0; c < labels.cols; c++) {
            outRow[c] = keep[labelRow[c]];
        }
    }

    cout << "[DEBUG] Kept " << kept << " of " << max(numComponents - 1, 0)
         << " components with area >= " << minArea << endl;
    return filtered;
}

Mat ComponentFilter::cleanMask(const Mat& mask, int minArea, const FilterParams& params) {
    return removeSmallComponents(morphologicalOpen(mask, params), minArea, params);
}

map<string, Mat> ComponentFilter::filter(const vector<ColorSegmenter::ColorMask>& masks,
                                         const TuningTable& tuning,
                                         const FilterParams& params) {
    map<string, Mat> cleaned;

    for (const auto& [baseColor, mask] : mergeByBaseColor(masks)) {
        int minArea = tuning.lookup(baseColor).minComponentArea;
        Mat filtered = cleanMask(mask, minArea, params);

        int remaining = countNonZero(filtered);
        if (remaining == 0) {
            cout << "[INFO] No curve pixels survive filtering for " << baseColor << ", skipping" << endl;
            continue;
        }

        cout << "[INFO] " << baseColor << ": " << remaining << " curve pixels after filtering" << endl;
        cleaned.emplace(baseColor, filtered);
    }
    return cleaned;
}

} // namespace CurveTrace
