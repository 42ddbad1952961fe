#include "uil/ui_detector.hpp"
#include "uil/color_detector.hpp"
#include "uil/image_loader.hpp"
#include "uil/merger.hpp"
#include "uil/shape_detector.hpp"

namespace uil
{

    std::vector<UIElement> detect_ui_elements(const cv::Mat &bgr, const DetectOptions &opt)
    {
        if (bgr.empty())
            return {};
        // max_area is resolved against this image once and shared by both passes
        DetectOptions resolved = opt;
        resolved.max_area = (int)resolve_max_area(opt, bgr.cols, bgr.rows);

        return merge(detect_shapes(bgr, resolved), detect_color_regions(bgr, resolved));
    }

    std::vector<UIElement> detect_ui_elements(const std::string &imageData, const DetectOptions &opt)
    {
        cv::Mat img;
        if (load_image(imageData, img) != Status::Ok)
            return {};
        return detect_ui_elements(img, opt);
    }

} // namespace uil
