#include <iomanip>
#include <iostream>
#include <vector>
#include "simplelife/config.hpp"
#include "simplelife/growth_update.hpp"
#include "simplelife/metrics.hpp"

using namespace simplelife;

namespace {

constexpr int kRowWidth = 4;

// 4x4 sample; potential would normally come from convolving the grid.
const std::vector<float> kSampleGrid = {
    0.5f,  0.75f, 0.9f, 1.0f,
    0.75f, 0.5f,  0.25f, 0.5f,
    0.25f, 0.75f, 0.5f, 0.25f,
    1.0f,  0.9f,  0.75f, 0.5f,
};
const std::vector<float> kSamplePotential = {
    0.5f, 0.75f, 0.5f, 0.25f,
    0.5f, 0.75f, 0.5f, 0.25f,
    0.5f, 0.75f, 0.5f, 0.25f,
    0.5f, 0.75f, 0.5f, 0.25f,
};

void print_grid(const std::vector<float>& grid) {
    std::cout << std::fixed << std::setprecision(2);
    for (std::size_t i = 0; i < grid.size(); ++i) {
        std::cout << grid[i] << ' ';
        if ((i + 1) % kRowWidth == 0) std::cout << '\n';
    }
    if (grid.size() % kRowWidth != 0) std::cout << '\n';
}

}

int main(int argc, char** argv) {
    try {
        AppConfig cfg = parse_args(argc, argv);
        if (cfg.help) {
            print_usage(argv[0]);
            return 0;
        }

        std::vector<float> grid = kSampleGrid;
        const std::vector<float>& potential = kSamplePotential;

        if (!cfg.quiet) {
            std::cout << "Grid values before update:\n";
            print_grid(grid);
        }

        for (int step = 0; step < cfg.steps; ++step) {
            update_grid(grid, potential, cfg.dt);
        }

        if (!cfg.quiet) {
            std::cout << "Grid values after update:\n";
            print_grid(grid);
        }

        std::cout << format_summary(grid) << "\n";
        if (all_dead(grid)) {
            std::cout << "WARNING: All cells have died! The simulation might need adjustment.\n";
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
}
