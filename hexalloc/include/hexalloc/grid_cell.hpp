#ifndef HEXALLOC_GRID_CELL_HPP_
#define HEXALLOC_GRID_CELL_HPP_

#include <cstddef>
#include <Eigen/Dense>
#include "hexalloc/hex_geometry.hpp"

namespace hexalloc
{

constexpr int kDefaultPriority = 1;
constexpr int kHighPriority = 2;

struct GridCell {
    // Sequential id assigned by the grid builder
    std::size_t id = 0;

    // Center of the unclipped hexagon
    Eigen::Vector2d center = Eigen::Vector2d::Zero();

    // Hexagon clipped to the boundary. More than one part only when a
    // non-convex boundary splits the hexagon.
    MultiPolygon polygon;

    double area = 0.0;

    // Overrides set by cell filters after generation
    int priority = kDefaultPriority;
    bool restricted = false;
};

}  // namespace hexalloc

#endif  // HEXALLOC_GRID_CELL_HPP_
