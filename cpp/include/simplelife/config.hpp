#pragma once
#include <string>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace simplelife {

struct AppConfig {
    float dt    = 0.1f;   // time step
    int   steps = 1;      // updates against the fixed potential
    bool  quiet = false;  // summary only
    bool  help  = false;
};

inline void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--dt DT] [--steps N] [--quiet] [--help]\n";
}

inline bool parse_int(const char* s, int& out, int minv, int maxv) {
    try {
        std::size_t used = 0;
        long v = std::stol(s, &used);
        if (s[used] != '\0' || v < minv || v > maxv) return false;
        out = int(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool parse_float(const char* s, float& out, float minv, float maxv) {
    try {
        std::size_t used = 0;
        float v = std::stof(s, &used);
        if (s[used] != '\0' || !(v >= minv && v <= maxv)) return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const std::string& name) {
            if (i + 1 >= argc) throw std::runtime_error("missing value for " + name);
            return argv[++i];
        };

        if (a == "--dt" || a == "-t") {
            if (!parse_float(need(a), cfg.dt, -100.0f, 100.0f)) throw std::runtime_error("invalid dt (-100..100)");
        } else if (a == "--steps" || a == "-s") {
            if (!parse_int(need(a), cfg.steps, 1, 1000000)) throw std::runtime_error("invalid steps (1..1000000)");
        } else if (a == "--quiet" || a == "-q") {
            cfg.quiet = true;
        } else if (a == "--help" || a == "-?") {
            cfg.help = true;
        } else {
            std::ostringstream oss;
            oss << "unknown argument: " << a;
            throw std::runtime_error(oss.str());
        }
    }
    return cfg;
}

}
