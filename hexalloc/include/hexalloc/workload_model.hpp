#ifndef HEXALLOC_WORKLOAD_MODEL_HPP_
#define HEXALLOC_WORKLOAD_MODEL_HPP_

#include <vector>
#include "hexalloc/grid_cell.hpp"
#include "hexalloc/vehicle.hpp"

namespace hexalloc
{

inline double cellWorkload(const GridCell & cell)
{
  return cell.area * cell.priority;
}

/// @brief Sum of cell workloads.
/// @throws InvalidCellError if a cell has a negative priority.
/// @throws ZeroWorkloadError if the sum is not positive.
double totalWorkload(const std::vector<GridCell> & cells);

/// @brief Checks ids, battery fractions and supplied capacities of a fleet.
/// @throws InvalidFleetError on an empty fleet or any invalid entry.
void validateFleet(const std::vector<Vehicle> & fleet);

/// @brief Fills in capacity_workload for vehicles that do not supply one.
/// Missing capacities are the battery-weighted share of the total workload;
/// supplied capacities are left untouched.
/// @return Capacities in fleet order.
std::vector<double> resolveCapacities(std::vector<Vehicle> & fleet, double total_workload);

}  // namespace hexalloc

#endif  // HEXALLOC_WORKLOAD_MODEL_HPP_
