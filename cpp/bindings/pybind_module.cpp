#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <stdexcept>
#include <string>
#include "simplelife/growth_update.hpp"
#include "simplelife/metrics.hpp"

namespace py = pybind11;
using namespace simplelife;

namespace {

void require_1d(const py::buffer_info& buf, const char* name) {
    if (buf.ndim != 1) {
        throw std::runtime_error(std::string(name) + " must be 1D");
    }
}

std::vector<float> to_vector(py::array_t<float, py::array::c_style | py::array::forcecast> data, const char* name) {
    auto buf = data.request();
    require_1d(buf, name);
    const float* ptr = static_cast<float*>(buf.ptr);
    return std::vector<float>(ptr, ptr + buf.shape[0]);
}

}

// grid is updated in place, so it is never converted: a copy would discard the result.
void py_update_grid(py::array_t<float, py::array::c_style> grid,
                    py::array_t<float, py::array::c_style | py::array::forcecast> potential,
                    float dt) {
    if (grid.ndim() != 1) {
        throw std::runtime_error("grid must be 1D");
    }
    if (potential.ndim() != 1) {
        throw std::runtime_error("potential must be 1D");
    }
    if (grid.shape(0) != potential.shape(0)) {
        throw std::invalid_argument("grid and potential length mismatch: " +
                                    std::to_string(grid.shape(0)) + " vs " +
                                    std::to_string(potential.shape(0)));
    }
    float* g = grid.mutable_data();
    const float* p = potential.data();
    const std::size_t n = static_cast<std::size_t>(grid.shape(0));
    py::gil_scoped_release release;
    update_grid(g, p, n, dt);
}

float py_active_fraction(py::array_t<float, py::array::c_style | py::array::forcecast> grid, float threshold) {
    return active_fraction(to_vector(grid, "grid"), threshold);
}

float py_entropy(py::array_t<float, py::array::c_style | py::array::forcecast> data) {
    return entropy(to_vector(data, "data"));
}

PYBIND11_MODULE(simplelife_native, m) {
    m.doc() = "SimpleLife growth update kernel";
    m.attr("BATCH_WIDTH") = kBatchWidth;
    m.attr("ACTIVE_THRESHOLD") = kActiveThreshold;
    m.def("update_grid", &py_update_grid, py::arg("grid").noconvert(), py::arg("potential"), py::arg("dt"),
          "Advance grid one step in place against potential");
    m.def("growth", &growth, py::arg("u"), "Growth map 2u(1-u) - 0.5");
    m.def("active_fraction", &py_active_fraction, py::arg("grid"), py::arg("threshold") = kActiveThreshold,
          "Fraction of cells above threshold");
    m.def("entropy", &py_entropy, "Compute simple entropy");
}
