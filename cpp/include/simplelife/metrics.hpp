#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace simplelife {

// A cell counts as alive above this value.
constexpr float kActiveThreshold = 0.01f;

struct GridSummary {
    std::size_t size;
    std::size_t active;
    float min;
    float max;
    float mean;
};

// Shannon entropy (bits) over tenth-wide value buckets.
float entropy(const std::vector<float>& data);

std::size_t active_cells(const std::vector<float>& grid, float threshold = kActiveThreshold);
float active_fraction(const std::vector<float>& grid, float threshold = kActiveThreshold);
bool all_dead(const std::vector<float>& grid);

GridSummary summarize(const std::vector<float>& grid);

// "Active cells: N (P% of grid) | min=.. max=.. mean=.. entropy=..", two decimals throughout.
std::string format_summary(const std::vector<float>& grid);

}
