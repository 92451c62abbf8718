#include "hexalloc/workload_model.hpp"
#include "hexalloc/exceptions.hpp"
#include <set>
#include <string>

namespace hexalloc
{

double totalWorkload(const std::vector<GridCell> & cells)
{
  double total = 0.0;
  for (const auto & cell : cells) {
    if (cell.priority < 0) {
      throw InvalidCellError(
        "Cell " + std::to_string(cell.id) + " has negative priority " + std::to_string(cell.priority));
    }
    total += cellWorkload(cell);
  }
  if (!(total > 0.0)) {
    throw ZeroWorkloadError(
      "Total workload over " + std::to_string(cells.size()) +
      " cells is not positive. Check cell areas and priorities.");
  }
  return total;
}

void validateFleet(const std::vector<Vehicle> & fleet)
{
  if (fleet.empty()) {
    throw InvalidFleetError("Fleet is empty");
  }
  std::set<int> ids;
  for (const auto & vehicle : fleet) {
    if (!ids.insert(vehicle.id).second) {
      throw InvalidFleetError("Duplicate vehicle id " + std::to_string(vehicle.id));
    }
    if (!(vehicle.battery_fraction > 0.0) || vehicle.battery_fraction > 1.0) {
      throw InvalidFleetError(
        "Vehicle " + std::to_string(vehicle.id) + " has battery fraction " +
        std::to_string(vehicle.battery_fraction) + " outside (0, 1]");
    }
    if (vehicle.capacity_workload && !(*vehicle.capacity_workload >= 0.0)) {
      throw InvalidFleetError("Vehicle " + std::to_string(vehicle.id) + " has a negative capacity");
    }
  }
}

std::vector<double> resolveCapacities(std::vector<Vehicle> & fleet, double total_workload)
{
  validateFleet(fleet);

  double battery_sum = 0.0;
  for (const auto & vehicle : fleet) {
    battery_sum += vehicle.battery_fraction;
  }

  std::vector<double> capacities;
  capacities.reserve(fleet.size());
  for (auto & vehicle : fleet) {
    if (!vehicle.capacity_workload) {
      vehicle.capacity_workload = total_workload * vehicle.battery_fraction / battery_sum;
    }
    capacities.push_back(*vehicle.capacity_workload);
  }
  return capacities;
}

}  // namespace hexalloc
