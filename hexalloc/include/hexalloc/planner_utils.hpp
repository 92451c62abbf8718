#ifndef HEXALLOC_PLANNER_UTILS_HPP_
#define HEXALLOC_PLANNER_UTILS_HPP_

#include <random>
#include <string>
#include <vector>
#include <grid_map_core/GridMap.hpp>
#include "hexalloc/assignment_result.hpp"
#include "hexalloc/grid_cell.hpp"
#include "hexalloc/hex_geometry.hpp"
#include "hexalloc/vehicle.hpp"

namespace hexalloc
{

class PlannerUtils
{
public:
  // Delete constructor to prevent instantiation
  PlannerUtils() = delete;

  /// @brief Parses a WKT polygon and normalizes its orientation and closure.
  /// @throws InvalidGeometryError if the text is not a valid polygon.
  static Polygon boundaryFromWkt(const std::string & wkt);

  /// @brief Axis-aligned rectangle with its lower-left corner at the origin.
  static Polygon rectangleBoundary(double width, double height);

  /// @brief Fleet with ids 0..n-1 and the given battery fractions.
  /// @param capacities Supplied capacities, empty or one per vehicle.
  /// @throws InvalidFleetError if capacities and batteries differ in length.
  static std::vector<Vehicle> fleetFromBatteries(const std::vector<double> & batteries, const std::vector<double> & capacities);

  /// @brief Fleet with ids 0..count-1 and batteries drawn uniformly from [battery_min, battery_max].
  static std::vector<Vehicle> randomFleet(std::size_t count, double battery_min, double battery_max, std::mt19937 & gen);

  /// @brief Resizes the grid map to the boundary and writes the zone, priority and restricted layers.
  /// Grid cells not covered by any assigned hex cell are NaN.
  static void rasterize(
    const Polygon & boundary,
    const std::vector<GridCell> & cells,
    const AssignmentResult & result,
    double resolution,
    grid_map::GridMap & grid_map);
};

}  // namespace hexalloc

#endif  // HEXALLOC_PLANNER_UTILS_HPP_
