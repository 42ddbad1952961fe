#include "uil/shape_detector.hpp"
#include "uil/log.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace uil
{

    namespace
    {
        // ========================= Tunables =========================
        struct Params
        {
            // preprocess
            int BLUR_K = 5;

            // edges
            int CANNY_LOW = 50;
            int CANNY_HIGH = 150;
            int DILATE_K = 3;
            int DILATE_ITERS = 2;

            // contour gates
            double MIN_ASPECT = 0.1;
            double MAX_ASPECT = 10.0;
            double APPROX_EPS_FRAC = 0.02;
        };
        const Params P{};

        struct ShapeRule
        {
            bool (*match)(const ShapeMetrics &);
            const char *type;
            double confidence;
        };

        // Evaluated top-down. Add new shape classes here.
        const ShapeRule kShapeRules[] = {
            {[](const ShapeMetrics &m)
             { return m.vertices == 4; },
             "rectangle", 0.8},
            {[](const ShapeMetrics &m)
             { return m.circularity > 0.7; },
             "circle", 0.9},
            {[](const ShapeMetrics &m)
             { return m.vertices < 10; },
             "polygon", 0.6},
        };
        const ShapeClass kFallback{"unknown", 0.5};
    } // namespace

    ShapeClass classify_shape(const ShapeMetrics &m)
    {
        for (const auto &r : kShapeRules)
            if (r.match(m))
                return {r.type, r.confidence};
        return kFallback;
    }

    std::vector<UIElement> detect_shapes(const cv::Mat &bgr, const DetectOptions &opt)
    {
        std::vector<UIElement> out;
        if (bgr.empty())
            return out;

        const long long maxArea = resolve_max_area(opt, bgr.cols, bgr.rows);

        cv::Mat gray;
        if (bgr.channels() == 3)
            cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        else
            gray = bgr;
        cv::Mat blurred;
        cv::GaussianBlur(gray, blurred, {P.BLUR_K, P.BLUR_K}, 0);

        cv::Mat edges;
        cv::Canny(blurred, edges, P.CANNY_LOW, P.CANNY_HIGH);
        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(P.DILATE_K, P.DILATE_K));
        cv::dilate(edges, edges, k, {-1, -1}, P.DILATE_ITERS);

        std::vector<std::vector<cv::Point>> contours;
        std::vector<cv::Vec4i> hierarchy;
        cv::findContours(edges, contours, hierarchy, cv::RETR_TREE, cv::CHAIN_APPROX_SIMPLE);

        for (const auto &c : contours)
        {
            const cv::Rect r = cv::boundingRect(c);
            const long long area = (long long)r.width * r.height;
            if (area < opt.min_area || area > maxArea)
                continue;

            const double aspect = r.height > 0 ? (double)r.width / r.height : 0.0;
            if (aspect < P.MIN_ASPECT || aspect > P.MAX_ASPECT)
                continue;

            const double per = cv::arcLength(c, true);
            ShapeMetrics m;
            m.circularity = per > 0 ? 4.0 * CV_PI * cv::contourArea(c) / (per * per) : 0.0;

            std::vector<cv::Point> approx;
            cv::approxPolyDP(c, approx, P.APPROX_EPS_FRAC * per, true);
            m.vertices = (int)approx.size();

            const ShapeClass cls = classify_shape(m);
            out.push_back(make_element(r.x, r.y, r.width, r.height,
                                       cls.type, cls.confidence, m.vertices));
        }

        uil::log::d("shape detector: " + std::to_string(contours.size()) + " contours, " +
                    std::to_string(out.size()) + " kept");
        return out;
    }

} // namespace uil
