#pragma once
#include <vector>
#include <cstddef>

namespace simplelife {

// Growth map constants: growth(u) = kTwo * u * (kOne - u) - kHalf.
constexpr float kHalf = 0.5f;
constexpr float kTwo = 2.0f;
constexpr float kOne = 1.0f;
constexpr float kZero = 0.0f;

constexpr std::size_t kBatchWidth = 4;

float growth(float u);

// One forward-Euler step of a single cell, clamped to [0, 1].
float update_cell(float value, float u, float dt);

// grid and potential must both hold n floats.
void update_grid(float* grid, const float* potential, std::size_t n, float dt);

// Throws std::invalid_argument when the lengths differ; grid is untouched then.
void update_grid(std::vector<float>& grid, const std::vector<float>& potential, float dt);

}
