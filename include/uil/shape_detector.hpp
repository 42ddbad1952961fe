#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    // Per-contour measurements fed to the classification table.
    struct ShapeMetrics
    {
        int vertices = 0;         // after Douglas-Peucker simplification
        double circularity = 0.0; // 4*pi*area/perimeter^2, 0 if perimeter is 0
    };

    struct ShapeClass
    {
        std::string type;
        double confidence = 0.0;
    };

    // Ordered rule table, first match wins.
    ShapeClass classify_shape(const ShapeMetrics &m);

    // Edge/contour based detection on a BGR image.
    std::vector<UIElement> detect_shapes(const cv::Mat &bgr,
                                         const DetectOptions &opt = DetectOptions());
}
