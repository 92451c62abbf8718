#ifndef HEXALLOC_PLANNING_CONTEXT_HPP_
#define HEXALLOC_PLANNING_CONTEXT_HPP_

#include <optional>
#include <vector>
#include "hexalloc/assignment_result.hpp"
#include "hexalloc/grid_cell.hpp"
#include "hexalloc/hex_geometry.hpp"
#include "hexalloc/vehicle.hpp"

namespace hexalloc
{

struct PlanningContext {
    // Farm outline the cells were clipped against
    Polygon boundary;

    // Current cell set. Filters replace it, strategies only read it.
    std::vector<GridCell> cells;

    // Fleet in assignment order. Strategies fill in missing capacities.
    std::vector<Vehicle> fleet;

    // Written by the assignment strategy
    std::optional<AssignmentResult> result;
};

}  // namespace hexalloc

#endif  // HEXALLOC_PLANNING_CONTEXT_HPP_
