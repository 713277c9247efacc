#include "simplelife/metrics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace simplelife {

namespace {

// NaN gets its own bucket; everything else is clamped so the cast stays in range.
constexpr int kNanBucket = -1;

int bucket_of(float v) {
    if (std::isnan(v)) return kNanBucket;
    v = std::min(std::max(v, 0.0f), 1.0f);
    return static_cast<int>(v * 10.0f);
}

}

float entropy(const std::vector<float>& data) {
    std::unordered_map<int, int> bins;
    for (float v : data) {
        bins[bucket_of(v)]++;
    }
    float total = static_cast<float>(data.size());
    float h = 0.0f;
    for (auto& kv : bins) {
        float p = kv.second / total;
        h -= p * std::log2(p);
    }
    return h;
}

std::size_t active_cells(const std::vector<float>& grid, float threshold) {
    return static_cast<std::size_t>(
        std::count_if(grid.begin(), grid.end(), [threshold](float v) { return v > threshold; }));
}

float active_fraction(const std::vector<float>& grid, float threshold) {
    if (grid.empty()) return 0.0f;
    return static_cast<float>(active_cells(grid, threshold)) / static_cast<float>(grid.size());
}

bool all_dead(const std::vector<float>& grid) {
    return active_cells(grid) == 0;
}

GridSummary summarize(const std::vector<float>& grid) {
    GridSummary s{grid.size(), 0, 0.0f, 0.0f, 0.0f};
    if (grid.empty()) return s;
    auto mm = std::minmax_element(grid.begin(), grid.end());
    s.min = *mm.first;
    s.max = *mm.second;
    double sum = 0.0;
    for (float v : grid) sum += v;
    s.mean = static_cast<float>(sum / static_cast<double>(grid.size()));
    s.active = active_cells(grid);
    return s;
}

std::string format_summary(const std::vector<float>& grid) {
    GridSummary s = summarize(grid);
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << "Active cells: " << s.active << " (" << 100.0f * active_fraction(grid) << "% of grid)"
        << " | min=" << s.min << " max=" << s.max << " mean=" << s.mean
        << " entropy=" << entropy(grid);
    return out.str();
}

}
