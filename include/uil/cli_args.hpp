#pragma once
#include <string>
#include <vector>
#include "uil/element_ranker.hpp"
#include "uil/template_matcher.hpp"
#include "uil/types.hpp"

namespace uil
{
    struct CliArgs
    {
        std::string command; // detect | match | pick
        std::vector<std::string> inputs;
        DetectOptions detect;
        MatchOptions match;
        ElementQuery query;
    };

    // Parses a numeric flag value. Rejects trailing garbage, NaN/inf and
    // anything outside [lo, hi].
    bool parse_number(const std::string &s, double lo, double hi, double &out);

    // `args` excludes the program name. Returns false on an unknown option,
    // an out-of-range value or a wrong input count; the reason is logged.
    bool parse_cli_args(const std::vector<std::string> &args, CliArgs &out);
    bool parse_cli_args(int argc, char **argv, CliArgs &out);
}
