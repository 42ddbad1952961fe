#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    enum class MatchMethod
    {
        CCoeffNormed, // correlation coefficient (default, best for color patterns)
        CCorrNormed,  // cross-correlation (fast, less discriminative)
        SqDiffNormed  // squared difference (lower is better, inverted before use)
    };

    // "ccoeff_normed" | "ccorr_normed" | "sqdiff_normed"; anything else -> CCoeffNormed
    MatchMethod parse_match_method(const std::string &name);
    const char *match_method_name(MatchMethod m);

    struct MatchOptions
    {
        bool multi_scale = true;
        double threshold = 0.7;
        MatchMethod method = MatchMethod::CCoeffNormed;
    };

    // Matches one template scale. Returns InvalidParameter (and no candidates)
    // when the scaled template is empty or does not fit in the screenshot.
    Status match_at_scale(const cv::Mat &screenshot, const cv::Mat &templ,
                          double scale, const MatchOptions &opt,
                          std::vector<MatchCandidate> &out);

    // Greedy suppression: keeps the best candidate of every cluster whose
    // pairwise IoU exceeds `iou_threshold`. Result sorted by confidence.
    std::vector<MatchCandidate> non_max_suppression(std::vector<MatchCandidate> candidates,
                                                    double iou_threshold = 0.3);

    // All scales, thresholding and suppression. Sorted by confidence descending.
    std::vector<MatchCandidate> find_matches(const cv::Mat &screenshot,
                                             const cv::Mat &templ,
                                             const MatchOptions &opt = MatchOptions());

    // Same, from payloads/paths (see load_image). Empty when either fails to load.
    std::vector<MatchCandidate> find_matches(const std::string &screenshotData,
                                             const std::string &templateData,
                                             const MatchOptions &opt = MatchOptions());
}
