#include "uil/color_detector.hpp"
#include "uil/log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <climits>
#include <cmath>
#include <iterator>
#include <string>
#include <vector>

namespace uil
{

    namespace
    {
        // ========================= Tunables =========================
        struct Params
        {
            // HSV mask
            int S_MIN = 50;
            int V_MIN = 40;

            // mask cleanup
            int CLOSE_K = 7;
            int CLOSE_ITERS = 2;
            int OPEN_K = 5;
            int OPEN_ITERS = 1;
            int DILATE_K = 5;
            int DILATE_ITERS = 1;

            // region gates
            int MIN_AREA_FLOOR = 200;
            double MIN_AREA_FRAC = 0.5; // of DetectOptions::min_area
            double MIN_ASPECT = 0.05;
            double MAX_ASPECT = 15.0;
            double APPROX_EPS_FRAC = 0.02;

            // confidence = min(CONF_MAX, CONF_BASE + S/255*CONF_S + V/255*CONF_V)
            double CONF_BASE = 0.7;
            double CONF_S = 0.15;
            double CONF_V = 0.1;
            double CONF_MAX = 0.95;
        };
        const Params P{};

        struct HueBucket
        {
            double upper; // inclusive, OpenCV hue units
            const char *name;
        };

        // Sorted by upper bound; red wraps around both ends.
        const HueBucket kHueBuckets[] = {
            {10, "red"},
            {22, "orange"},
            {33, "yellow"},
            {78, "green"},
            {96, "cyan"},
            {130, "blue"},
            {150, "purple"},
            {170, "pink"},
            {180, "red"},
        };

        cv::Mat kernel(int k)
        {
            return cv::getStructuringElement(cv::MORPH_RECT, cv::Size(k, k));
        }

        // Saturation-weighted circular mean of hue over the masked pixels.
        double mean_hue(const cv::Mat &hsv, const cv::Mat &mask)
        {
            double sc = 0.0, ss = 0.0;
            for (int y = 0; y < hsv.rows; ++y)
            {
                const cv::Vec3b *hr = hsv.ptr<cv::Vec3b>(y);
                const uchar *mr = mask.ptr<uchar>(y);
                for (int x = 0; x < hsv.cols; ++x)
                {
                    if (!mr[x])
                        continue;
                    const double a = hr[x][0] * (CV_PI / 90.0); // 0..179 -> 0..2pi
                    const double w = hr[x][1];
                    sc += w * std::cos(a);
                    ss += w * std::sin(a);
                }
            }
            if (std::abs(sc) < 1e-9 && std::abs(ss) < 1e-9)
                return 0.0;
            double deg = std::atan2(ss, sc) * 180.0 / CV_PI;
            if (deg < 0)
                deg += 360.0;
            return deg / 2.0;
        }
    } // namespace

    const char *hue_bucket_name(double hue)
    {
        auto it = std::lower_bound(std::begin(kHueBuckets), std::end(kHueBuckets), hue,
                                   [](const HueBucket &b, double h)
                                   { return b.upper < h; });
        if (it == std::end(kHueBuckets))
            return "red";
        return it->name;
    }

    std::vector<UIElement> detect_color_regions(const cv::Mat &bgr, const DetectOptions &opt)
    {
        std::vector<UIElement> out;
        if (bgr.empty() || bgr.channels() != 3)
            return out;

        const long long maxArea = resolve_max_area(opt, bgr.cols, bgr.rows);
        const double minArea = std::max((double)P.MIN_AREA_FLOOR, opt.min_area * P.MIN_AREA_FRAC);

        cv::Mat hsv;
        cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

        // vivid + reasonably bright, any hue
        cv::Mat raw;
        cv::inRange(hsv, cv::Scalar(0, P.S_MIN, P.V_MIN), cv::Scalar(180, 255, 255), raw);

        cv::Mat mask;
        cv::morphologyEx(raw, mask, cv::MORPH_CLOSE, kernel(P.CLOSE_K), {-1, -1}, P.CLOSE_ITERS);
        cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel(P.OPEN_K), {-1, -1}, P.OPEN_ITERS);
        cv::dilate(mask, mask, kernel(P.DILATE_K), {-1, -1}, P.DILATE_ITERS);

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

        for (size_t i = 0; i < contours.size(); ++i)
        {
            const auto &c = contours[i];
            const cv::Rect blobBox = cv::boundingRect(c);
            if (blobBox.area() <= 0)
                continue;

            // filled blob in blobBox coordinates
            cv::Mat blob(blobBox.size(), CV_8U, cv::Scalar(0));
            cv::drawContours(blob, contours, (int)i, cv::Scalar(255), cv::FILLED,
                             cv::LINE_8, cv::noArray(), INT_MAX, -blobBox.tl());

            // shrink back to the vivid pixels the cleanup grew around
            cv::Mat inside;
            cv::bitwise_and(raw(blobBox), blob, inside);
            if (cv::countNonZero(inside) == 0)
                continue;
            const cv::Rect local = cv::boundingRect(inside);
            const cv::Rect box = local + blobBox.tl();

            const double area = (double)box.width * box.height;
            if (area < minArea || area > (double)maxArea)
                continue;
            const double aspect = box.height > 0 ? (double)box.width / box.height : 0.0;
            if (aspect < P.MIN_ASPECT || aspect > P.MAX_ASPECT)
                continue;

            const cv::Mat region = blob(local);
            const cv::Mat hsvBox = hsv(box);
            const cv::Scalar meanHsv = cv::mean(hsvBox, region);
            const double meanS = meanHsv[1], meanV = meanHsv[2];
            if (meanS < P.S_MIN || meanV < P.V_MIN)
                continue; // dilation bleed into a gray/dark area

            const double conf = std::min(P.CONF_MAX, P.CONF_BASE +
                                                         meanS / 255.0 * P.CONF_S +
                                                         meanV / 255.0 * P.CONF_V);
            const double hue = mean_hue(hsvBox, region);

            std::vector<cv::Point> approx;
            cv::approxPolyDP(c, approx, P.APPROX_EPS_FRAC * cv::arcLength(c, true), true);

            out.push_back(make_element(box.x, box.y, box.width, box.height,
                                       std::string("color_button_") + hue_bucket_name(hue),
                                       conf, (int)approx.size()));
        }

        uil::log::d("color detector: " + std::to_string(contours.size()) + " blobs, " +
                    std::to_string(out.size()) + " kept");
        return out;
    }

} // namespace uil
