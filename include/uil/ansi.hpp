#pragma once
#include <cstdio>
#include <unistd.h>

namespace uil::ansi
{
    inline constexpr const char *reset = "\x1b[0m";
    inline constexpr const char *bold = "\x1b[1m";

    inline constexpr const char *ok = "\x1b[38;5;82m";
    inline constexpr const char *warn = "\x1b[38;5;214m";
    inline constexpr const char *err = "\x1b[38;5;196m";
    inline constexpr const char *muted = "\x1b[90m";

    // Empty codes when stdout is not a terminal.
    inline bool enabled() { return ::isatty(::fileno(stdout)) != 0; }

    inline const char *c(const char *code) { return enabled() ? code : ""; }
}
