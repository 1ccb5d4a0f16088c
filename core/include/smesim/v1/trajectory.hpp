#pragma once

#include "smesim/v1/numeric_types.hpp"

#include <cstddef>
#include <vector>

namespace smesim::v1 {

/// States sampled at every point of a time grid, initial state first
struct Trajectory {
    std::vector<Real> times;
    std::vector<Vector> states;

    [[nodiscard]] std::size_t size() const { return states.size(); }
    [[nodiscard]] bool empty() const { return states.empty(); }
    [[nodiscard]] const Vector& initial_state() const { return states.front(); }
    [[nodiscard]] const Vector& final_state() const { return states.back(); }
};

}  // namespace smesim::v1
