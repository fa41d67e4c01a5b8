#include "ColorSegmenter.hpp"
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cstdio>

using namespace cv;
using namespace std;

namespace CurveTrace {

Mat ColorSegmenter::convertToHSV(const Mat& bgrImg) {
    if (bgrImg.empty() || bgrImg.channels() != 3) {
        throw invalid_argument("HSV conversion requires a non-empty 3-channel BGR image");
    }

    Mat hsv;
    cvtColor(bgrImg, hsv, COLOR_BGR2HSV);
    return hsv;
}

Mat ColorSegmenter::thresholdSpec(const Mat& hsvImg, const ColorSpec& spec) {
    Mat mask;
    inRange(hsvImg, spec.lower, spec.upper, mask);
    return mask;
}

vector<ColorSegmenter::ColorMask> ColorSegmenter::segment(const Mat& canvas, const vector<ColorSpec>& specs) {
    cout << "[INFO] Segmenting canvas into " << specs.size() << " color classes" << endl;

    Mat hsv = convertToHSV(canvas);

    vector<ColorMask> masks;
    masks.reserve(specs.size());
    for (const auto& spec : specs) {
        Mat mask = thresholdSpec(hsv, spec);
        cout << "[DEBUG] " << spec.name << ": " << countNonZero(mask) << " pixels in range" << endl;
        masks.push_back({spec.name, spec.baseColor, mask});
    }
    return masks;
}

vector<ColorSegmenter::ColorPresence> ColorSegmenter::surveyColors(const Mat& bgrImg,
                                                                   const vector<ColorSpec>& specs,
                                                                   int minPixels) {
    Mat hsv = convertToHSV(bgrImg);

    vector<ColorPresence> detected;
    for (const auto& spec : specs) {
        Mat mask = thresholdSpec(hsv, spec);
        int pixelCount = countNonZero(mask);
        if (pixelCount <= minPixels) {
            continue;
        }

        Scalar avg = mean(bgrImg, mask);
        char hex[8];
        snprintf(hex, sizeof(hex), "#%02x%02x%02x",
                 static_cast<int>(avg[2]), static_cast<int>(avg[1]), static_cast<int>(avg[0]));

        ColorPresence presence;
        presence.name = spec.name;
        presence.baseColor = spec.baseColor;
        presence.pixelCount = pixelCount;
        presence.hexColor = hex;
        presence.confidence = min(pixelCount / 1000.0, 1.0);
        detected.push_back(presence);
    }

    stable_sort(detected.begin(), detected.end(), [](const ColorPresence& a, const ColorPresence& b) {
        return a.pixelCount > b.pixelCount;
    });

    cout << "[INFO] Color survey found " << detected.size() << " colors above " << minPixels << " pixels" << endl;
    return detected;
}

} // namespace CurveTrace
