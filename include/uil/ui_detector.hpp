#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    // Shape + color detection, merged. At most 100 elements, largest first.
    std::vector<UIElement> detect_ui_elements(const cv::Mat &bgr,
                                              const DetectOptions &opt = DetectOptions());

    // From a payload or path; empty when the image cannot be loaded.
    std::vector<UIElement> detect_ui_elements(const std::string &imageData,
                                              const DetectOptions &opt = DetectOptions());
}
