#include "uil/template_matcher.hpp"
#include "uil/geometry.hpp"
#include "uil/image_loader.hpp"
#include "uil/log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <unordered_map>
#include <vector>

namespace uil
{

    namespace
    {
        struct Params
        {
            double NMS_IOU = 0.3;
        };
        const Params P{};

        const double kScales[] = {0.5, 0.75, 1.0, 1.25, 1.5};

        int floor_div(int a, int b)
        {
            return a >= 0 ? a / b : -((-a + b - 1) / b);
        }

        uint64_t cell_key(int gx, int gy)
        {
            return ((uint64_t)(uint32_t)gx << 32) | (uint32_t)gy;
        }

        int cv_method(MatchMethod m)
        {
            switch (m)
            {
            case MatchMethod::CCorrNormed:
                return cv::TM_CCORR_NORMED;
            case MatchMethod::SqDiffNormed:
                return cv::TM_SQDIFF_NORMED;
            case MatchMethod::CCoeffNormed:
                break;
            }
            return cv::TM_CCOEFF_NORMED;
        }
    } // namespace

    MatchMethod parse_match_method(const std::string &name)
    {
        if (name == "ccorr_normed")
            return MatchMethod::CCorrNormed;
        if (name == "sqdiff_normed")
            return MatchMethod::SqDiffNormed;
        if (name != "ccoeff_normed" && !name.empty())
            uil::log::w("Unknown match method '" + name + "', using ccoeff_normed");
        return MatchMethod::CCoeffNormed;
    }

    const char *match_method_name(MatchMethod m)
    {
        switch (m)
        {
        case MatchMethod::CCorrNormed:
            return "ccorr_normed";
        case MatchMethod::SqDiffNormed:
            return "sqdiff_normed";
        case MatchMethod::CCoeffNormed:
            break;
        }
        return "ccoeff_normed";
    }

    Status match_at_scale(const cv::Mat &screenshot, const cv::Mat &templ,
                          double scale, const MatchOptions &opt,
                          std::vector<MatchCandidate> &out)
    {
        const int newW = (int)(templ.cols * scale);
        const int newH = (int)(templ.rows * scale);
        if (newW <= 0 || newH <= 0)
            return Status::InvalidParameter;
        if (newW > screenshot.cols || newH > screenshot.rows)
            return Status::InvalidParameter;

        cv::Mat resized;
        if (newW == templ.cols && newH == templ.rows)
            resized = templ;
        else
            cv::resize(templ, resized, cv::Size(newW, newH), 0, 0, cv::INTER_LINEAR);

        cv::Mat result;
        cv::matchTemplate(screenshot, resized, result, cv_method(opt.method));

        const bool inverted = (opt.method == MatchMethod::SqDiffNormed);
        for (int y = 0; y < result.rows; ++y)
        {
            const float *row = result.ptr<float>(y);
            for (int x = 0; x < result.cols; ++x)
            {
                double score = inverted ? 1.0 - (double)row[x] : (double)row[x];
                if (!(score >= opt.threshold)) // also rejects NaN
                    continue;
                MatchCandidate m;
                finalize_box(m, x, y, newW, newH);
                m.confidence = std::clamp(score, 0.0, 1.0);
                m.scale = scale;
                out.push_back(m);
            }
        }
        return Status::Ok;
    }

    std::vector<MatchCandidate> non_max_suppression(std::vector<MatchCandidate> candidates,
                                                    double iou_threshold)
    {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const MatchCandidate &a, const MatchCandidate &b)
                         { return a.confidence > b.confidence; });

        std::vector<MatchCandidate> kept;
        if (iou_threshold < 0.0)
        {
            // disjoint boxes (IoU 0) suppress each other too: only the best survives
            if (!candidates.empty())
                kept.push_back(candidates.front());
            return kept;
        }

        // IoU > threshold >= 0 needs a positive intersection, so two boxes can
        // only suppress each other if they share a grid cell. With the cell as
        // large as the largest box, each box spans at most 2x2 cells.
        int cell = 1;
        for (const auto &c : candidates)
            cell = std::max({cell, c.width, c.height});

        std::unordered_map<uint64_t, std::vector<size_t>> grid;
        std::vector<uint64_t> keys;
        for (const auto &c : candidates)
        {
            const geom::Box bc = geom::box_of(c);
            if (bc.w <= 0 || bc.h <= 0)
            {
                kept.push_back(c); // empty box overlaps nothing
                continue;
            }
            const int cx0 = floor_div(bc.x, cell), cx1 = floor_div(bc.x + bc.w - 1, cell);
            const int cy0 = floor_div(bc.y, cell), cy1 = floor_div(bc.y + bc.h - 1, cell);

            keys.clear();
            bool overlapping = false;
            for (int gy = cy0; gy <= cy1 && !overlapping; ++gy)
            {
                for (int gx = cx0; gx <= cx1 && !overlapping; ++gx)
                {
                    keys.push_back(cell_key(gx, gy));
                    auto it = grid.find(keys.back());
                    if (it == grid.end())
                        continue;
                    for (size_t k : it->second)
                    {
                        if (geom::iou(bc, geom::box_of(kept[k])) > iou_threshold)
                        {
                            overlapping = true;
                            break;
                        }
                    }
                }
            }
            if (overlapping)
                continue;
            for (uint64_t key : keys)
                grid[key].push_back(kept.size());
            kept.push_back(c);
        }
        return kept;
    }

    std::vector<MatchCandidate> find_matches(const cv::Mat &screenshot,
                                             const cv::Mat &templ,
                                             const MatchOptions &opt)
    {
        if (screenshot.empty() || templ.empty())
            return {};
        if (screenshot.type() != templ.type())
        {
            uil::log::w("Screenshot and template pixel formats differ");
            return {};
        }

        std::vector<double> scales;
        if (opt.multi_scale)
            scales.assign(std::begin(kScales), std::end(kScales));
        else
            scales.push_back(1.0);

        std::vector<MatchCandidate> all;
        for (double s : scales)
        {
            const size_t before = all.size();
            Status st = match_at_scale(screenshot, templ, s, opt, all);
            if (st != Status::Ok)
            {
                uil::log::d("scale " + std::to_string(s) + " skipped (" + status_name(st) + ")");
                continue;
            }
            uil::log::d("scale " + std::to_string(s) + ": " +
                        std::to_string(all.size() - before) + " raw hits");
        }

        auto kept = non_max_suppression(std::move(all), P.NMS_IOU);
        uil::log::d("template matches after suppression: " + std::to_string(kept.size()));
        return kept;
    }

    std::vector<MatchCandidate> find_matches(const std::string &screenshotData,
                                             const std::string &templateData,
                                             const MatchOptions &opt)
    {
        cv::Mat screenshot, templ;
        if (load_image(screenshotData, screenshot) != Status::Ok)
            return {};
        if (load_image(templateData, templ) != Status::Ok)
            return {};
        return find_matches(screenshot, templ, opt);
    }

} // namespace uil
