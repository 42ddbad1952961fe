#pragma once
#include <cstdlib>
#include <iostream>
#include <string>

namespace uil::log
{
    inline bool g_debug = false;

    inline void set(bool debug) { g_debug = debug; }

    // UIL_DEBUG=1 (or any non-"0" value) turns on debug output
    inline void init_from_env()
    {
        const char *env = std::getenv("UIL_DEBUG");
        if (env && *env && std::string(env) != "0")
            g_debug = true;
    }

    inline void d(const std::string &msg)
    {
        if (g_debug)
            std::cerr << "[DBG] " << msg << "\n";
    }
    inline void i(const std::string &msg) { std::cerr << "[INF] " << msg << "\n"; }
    inline void w(const std::string &msg) { std::cerr << "[WRN] " << msg << "\n"; }
    inline void e(const std::string &msg) { std::cerr << "[ERR] " << msg << "\n"; }
}
