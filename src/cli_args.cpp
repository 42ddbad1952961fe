#include "uil/cli_args.hpp"
#include "uil/log.hpp"

#include <climits>
#include <cmath>
#include <cstdlib>

namespace uil
{
    namespace
    {
        // flags that take a bounded numeric value
        struct NumericFlag
        {
            const char *name;
            double lo, hi;
        };

        const NumericFlag kNumericFlags[] = {
            {"--threshold", 0.0, 1.0},
            {"--min-confidence", 0.0, 1.0},
            {"--min-area", 0.0, (double)INT_MAX},
            {"--max-area", 0.0, (double)INT_MAX},
        };

        const NumericFlag *numeric_flag(const std::string &s)
        {
            for (const auto &f : kNumericFlags)
                if (s == f.name)
                    return &f;
            return nullptr;
        }

        void set_numeric(const std::string &flag, double v, CliArgs &a)
        {
            if (flag == "--threshold")
                a.match.threshold = v;
            else if (flag == "--min-confidence")
                a.query.min_confidence = v;
            else if (flag == "--min-area")
                a.detect.min_area = (int)v;
            else
                a.detect.max_area = (int)v;
        }
    }

    bool parse_number(const std::string &s, double lo, double hi, double &out)
    {
        if (s.empty())
            return false;
        char *end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(v))
            return false;
        if (v < lo || v > hi)
            return false;
        out = v;
        return true;
    }

    bool parse_cli_args(const std::vector<std::string> &args, CliArgs &a)
    {
        if (args.empty())
            return false;
        a.command = args[0];
        for (size_t i = 1; i < args.size(); i++)
        {
            const std::string &s = args[i];
            const bool hasValue = i + 1 < args.size();
            if (s == "--debug")
                log::set(true);
            else if (s == "--single-scale")
                a.match.multi_scale = false;
            else if (s == "--method" && hasValue)
                a.match.method = parse_match_method(args[++i]);
            else if (s == "--type" && hasValue)
                a.query.type = args[++i];
            else if (s == "--position" && hasValue)
                a.query.position = parse_screen_position(args[++i]);
            else if (const NumericFlag *f = numeric_flag(s))
            {
                double v = 0.0;
                if (!hasValue || !parse_number(args[i + 1], f->lo, f->hi, v))
                {
                    log::e(std::string("Bad value for ") + f->name + ": " +
                           (hasValue ? args[i + 1] : std::string("(missing)")));
                    return false;
                }
                set_numeric(s, v, a);
                ++i;
            }
            else if (s.rfind("--", 0) == 0)
            {
                log::e("Unknown or incomplete option: " + s);
                return false;
            }
            else
                a.inputs.push_back(s);
        }
        if (a.command == "match")
            return a.inputs.size() == 2;
        return (a.command == "detect" || a.command == "pick") && a.inputs.size() == 1;
    }

    bool parse_cli_args(int argc, char **argv, CliArgs &out)
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; i++)
            args.emplace_back(argv[i]);
        return parse_cli_args(args, out);
    }
}
