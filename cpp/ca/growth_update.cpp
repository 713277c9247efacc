#include "simplelife/growth_update.hpp"
#include <stdexcept>
#include <string>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace simplelife {

namespace {

// Below this many batches the thread fork costs more than the loop.
constexpr std::size_t kParallelBatches = 4096;

// Unordered comparisons pick the bound, as SSE maxss/minss do: NaN lands on 0.
inline float clamp01(float v) {
    v = (v > kZero) ? v : kZero;
    v = (v < kOne) ? v : kOne;
    return v;
}

// Same operation sequence as update_cell, one op at a time across all lanes.
inline void update_batch(float* grid, const float* potential, float dt) {
    float t[kBatchWidth];
    for (std::size_t k = 0; k < kBatchWidth; ++k) t[k] = kOne - potential[k];
    for (std::size_t k = 0; k < kBatchWidth; ++k) t[k] *= potential[k];
    for (std::size_t k = 0; k < kBatchWidth; ++k) t[k] *= kTwo;
    for (std::size_t k = 0; k < kBatchWidth; ++k) t[k] -= kHalf;
    for (std::size_t k = 0; k < kBatchWidth; ++k) t[k] *= dt;
    for (std::size_t k = 0; k < kBatchWidth; ++k) grid[k] = clamp01(grid[k] + t[k]);
}

}

float growth(float u) {
    float t = kOne - u;
    t *= u;
    t *= kTwo;
    t -= kHalf;
    return t;
}

float update_cell(float value, float u, float dt) {
    float t = growth(u);
    t *= dt;
    return clamp01(value + t);
}

void update_grid(float* grid, const float* potential, std::size_t n, float dt) {
    const std::size_t batches = n / kBatchWidth;
    const std::ptrdiff_t batch_count = static_cast<std::ptrdiff_t>(batches);

    #pragma omp parallel for if(batches > kParallelBatches)
    for (std::ptrdiff_t b = 0; b < batch_count; ++b) {
        const std::size_t base = static_cast<std::size_t>(b) * kBatchWidth;
        update_batch(grid + base, potential + base, dt);
    }

    // tail shorter than one batch
    for (std::size_t i = batches * kBatchWidth; i < n; ++i) {
        grid[i] = update_cell(grid[i], potential[i], dt);
    }
}

void update_grid(std::vector<float>& grid, const std::vector<float>& potential, float dt) {
    if (grid.size() != potential.size()) {
        throw std::invalid_argument("grid and potential length mismatch: " +
                                    std::to_string(grid.size()) + " vs " +
                                    std::to_string(potential.size()));
    }
    update_grid(grid.data(), potential.data(), grid.size(), dt);
}

}
