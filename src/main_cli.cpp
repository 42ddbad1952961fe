#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "uil/ansi.hpp"
#include "uil/cli_args.hpp"
#include "uil/element_ranker.hpp"
#include "uil/image_loader.hpp"
#include "uil/log.hpp"
#include "uil/template_matcher.hpp"
#include "uil/ui_detector.hpp"

namespace
{
    const char *kUsage =
        "Usage:\n"
        "  uil_cli detect IMAGE [--min-area N] [--max-area N]\n"
        "  uil_cli match SCREENSHOT TEMPLATE [--threshold T] [--method M] [--single-scale]\n"
        "  uil_cli pick IMAGE [--type T] [--min-confidence C] [--position P] [--min-area N]\n"
        "Global: --debug (or UIL_DEBUG=1)\n";

    void print_element(const uil::UIElement &e)
    {
        std::cout << e.type << " x=" << e.x << " y=" << e.y
                  << " w=" << e.width << " h=" << e.height
                  << " center=(" << e.center_x << "," << e.center_y << ")"
                  << " area=" << e.area << " vertices=" << e.vertices
                  << std::fixed << std::setprecision(2) << " conf=" << e.confidence << "\n";
    }

    int not_found(const std::string &what)
    {
        std::cerr << uil::ansi::c(uil::ansi::warn) << what << uil::ansi::c(uil::ansi::reset) << "\n";
        return 2;
    }

    int run_detect(const uil::CliArgs &a, const cv::Mat &img)
    {
        auto elements = uil::detect_ui_elements(img, a.detect);
        if (elements.empty())
            return not_found("No UI elements found");
        for (const auto &e : elements)
            print_element(e);
        std::cerr << uil::ansi::c(uil::ansi::ok) << elements.size() << " element(s)"
                  << uil::ansi::c(uil::ansi::reset) << "\n";
        return 0;
    }

    int run_match(const uil::CliArgs &a, const cv::Mat &screenshot, const cv::Mat &templ)
    {
        auto matches = uil::find_matches(screenshot, templ, a.match);
        if (matches.empty())
            return not_found("No template matches");
        for (const auto &m : matches)
        {
            std::cout << "match x=" << m.x << " y=" << m.y
                      << " w=" << m.width << " h=" << m.height
                      << " center=(" << m.center_x << "," << m.center_y << ")"
                      << std::fixed << std::setprecision(3) << " conf=" << m.confidence
                      << std::setprecision(2) << " scale=" << m.scale << "\n";
        }
        std::cerr << uil::ansi::c(uil::ansi::ok) << matches.size() << " match(es) using "
                  << uil::match_method_name(a.match.method) << uil::ansi::c(uil::ansi::reset) << "\n";
        return 0;
    }

    int run_pick(const uil::CliArgs &a, const cv::Mat &img)
    {
        auto elements = uil::detect_ui_elements(img, a.detect);
        uil::ScoredElement best;
        if (!uil::select_best_element(elements, a.query, img.size(), best))
            return not_found("No element satisfies the query (" +
                             std::to_string(elements.size()) + " detected)");
        std::cout << std::fixed << std::setprecision(2) << "score=" << best.score << " ";
        print_element(best.element);
        return 0;
    }
}

int main(int argc, char **argv)
{
    uil::log::init_from_env();

    uil::CliArgs args;
    if (!uil::parse_cli_args(argc, argv, args))
    {
        std::cerr << kUsage;
        return 1;
    }

    std::vector<cv::Mat> images;
    for (const auto &in : args.inputs)
    {
        cv::Mat img;
        if (uil::load_image(in, img) != uil::Status::Ok)
        {
            std::cerr << uil::ansi::c(uil::ansi::err) << "Failed: " << in
                      << uil::ansi::c(uil::ansi::reset) << "\n";
            return 1;
        }
        images.push_back(img);
    }

    if (args.command == "detect")
        return run_detect(args, images[0]);
    if (args.command == "match")
        return run_match(args, images[0], images[1]);
    return run_pick(args, images[0]);
}
