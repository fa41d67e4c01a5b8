#pragma once

#include "ColorSegmenter.hpp"
#include "ColorTable.hpp"
#include <opencv2/opencv.hpp>
#include <map>
#include <string>
#include <vector>

namespace CurveTrace {

class ComponentFilter {
public:
    struct FilterParams {
        int morphKernelSize = 3;
        int connectivity    = 8;
    };

    // Union of all masks sharing a base color. Keys follow first appearance.
    static std::vector<std::pair<std::string, cv::Mat>> mergeByBaseColor(
        const std::vector<ColorSegmenter::ColorMask>& masks);

    static cv::Mat morphologicalOpen(const cv::Mat& mask, const FilterParams& params);

    // Keeps only connected components with area >= minArea.
    static cv::Mat removeSmallComponents(const cv::Mat& mask, int minArea, const FilterParams& params);

    static cv::Mat cleanMask(const cv::Mat& mask, int minArea, const FilterParams& params);

    // Base colors whose cleaned mask is empty are left out of the result.
    static std::map<std::string, cv::Mat> filter(const std::vector<ColorSegmenter::ColorMask>& masks,
                                                 const TuningTable& tuning,
                                                 const FilterParams& params);
};

} // namespace CurveTrace
