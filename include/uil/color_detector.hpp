#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    // Hue (OpenCV scale 0..179) -> "red", "orange", "yellow", "green",
    // "cyan", "blue", "purple" or "pink". Only used for naming.
    const char *hue_bucket_name(double hue);

    // Finds flat, vividly colored regions (typical game buttons) of any hue.
    // Elements are typed "color_button_<hue bucket>".
    std::vector<UIElement> detect_color_regions(const cv::Mat &bgr,
                                                const DetectOptions &opt = DetectOptions());
}
