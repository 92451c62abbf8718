#include "hexalloc/planner_utils.hpp"
#include "hexalloc/exceptions.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <grid_map_core/iterators/PolygonIterator.hpp>
#include <omp.h>

hexalloc::Polygon hexalloc::PlannerUtils::boundaryFromWkt(const std::string & wkt)
{
  Polygon boundary;
  try
  {
    bg::read_wkt(wkt, boundary);
  }
  catch (const bg::read_wkt_exception & e)
  {
    throw InvalidGeometryError(std::string("Cannot parse boundary WKT: ") + e.what());
  }
  bg::correct(boundary);

  std::string reason;
  if (!bg::is_valid(boundary, reason)) {
    throw InvalidGeometryError("Boundary polygon is invalid: " + reason);
  }
  return boundary;
}

hexalloc::Polygon hexalloc::PlannerUtils::rectangleBoundary(double width, double height)
{
  Polygon boundary;
  bg::append(boundary.outer(), Point(0.0, 0.0));
  bg::append(boundary.outer(), Point(width, 0.0));
  bg::append(boundary.outer(), Point(width, height));
  bg::append(boundary.outer(), Point(0.0, height));
  bg::append(boundary.outer(), Point(0.0, 0.0));
  bg::correct(boundary);
  return boundary;
}

std::vector<hexalloc::Vehicle> hexalloc::PlannerUtils::fleetFromBatteries(const std::vector<double> & batteries, const std::vector<double> & capacities)
{
  if (!capacities.empty() && capacities.size() != batteries.size()) {
    throw InvalidFleetError(
      "Got " + std::to_string(capacities.size()) + " capacities for " +
      std::to_string(batteries.size()) + " vehicles");
  }

  std::vector<Vehicle> fleet(batteries.size());
  for (size_t i = 0; i < batteries.size(); ++i) {
    fleet[i].id = static_cast<int>(i);
    fleet[i].battery_fraction = batteries[i];
    if (!capacities.empty()) {
      fleet[i].capacity_workload = capacities[i];
    }
  }
  return fleet;
}

std::vector<hexalloc::Vehicle> hexalloc::PlannerUtils::randomFleet(std::size_t count, double battery_min, double battery_max, std::mt19937 & gen)
{
  std::uniform_real_distribution<double> battery(battery_min, battery_max);
  std::vector<Vehicle> fleet(count);
  for (size_t i = 0; i < count; ++i) {
    fleet[i].id = static_cast<int>(i);
    fleet[i].battery_fraction = battery(gen);
  }
  return fleet;
}

void hexalloc::PlannerUtils::rasterize(
  const Polygon & boundary,
  const std::vector<GridCell> & cells,
  const AssignmentResult & result,
  double resolution,
  grid_map::GridMap & grid_map)
{
  Box bounds;
  bg::envelope(boundary, bounds);
  const grid_map::Length length(
    bounds.max_corner().x() - bounds.min_corner().x(),
    bounds.max_corner().y() - bounds.min_corner().y());
  const grid_map::Position center(
    (bounds.min_corner().x() + bounds.max_corner().x()) / 2.0,
    (bounds.min_corner().y() + bounds.max_corner().y()) / 2.0);
  grid_map.setGeometry(length, resolution, center);

  const float nan = std::numeric_limits<float>::quiet_NaN();
  for (const auto & layer : {"zone", "priority", "restricted"}) {
    if (!grid_map.exists(layer)) {
      grid_map.add(layer, nan);
    } else {
      grid_map[layer].setConstant(nan);
    }
  }

  std::vector<float> owner_vehicle(cells.size(), nan);
  for (const auto & zone : result.zones) {
    for (size_t idx : zone.cell_indices) {
      owner_vehicle.at(idx) = static_cast<float>(zone.vehicle_id);
    }
  }

  // Resolve the covering hex cell of every grid cell first, later cells win on shared edges
  const grid_map::Size size = grid_map.getSize();
  Eigen::MatrixXi owner = Eigen::MatrixXi::Constant(size(0), size(1), -1);
  for (size_t c = 0; c < cells.size(); ++c) {
    if (std::isnan(owner_vehicle[c])) {
      continue;
    }
    for (const auto & part : cells[c].polygon) {
      grid_map::Polygon outline;
      outline.setFrameId(grid_map.getFrameId());
      // Skip the closing vertex
      for (size_t v = 0; v + 1 < part.outer().size(); ++v) {
        outline.addVertex(grid_map::Position(part.outer()[v].x(), part.outer()[v].y()));
      }
      for (grid_map::PolygonIterator iterator(grid_map, outline); !iterator.isPastEnd(); ++iterator) {
        owner((*iterator)(0), (*iterator)(1)) = static_cast<int>(c);
      }
    }
  }

  grid_map::Matrix & zone_layer = grid_map["zone"];
  grid_map::Matrix & priority_layer = grid_map["priority"];
  grid_map::Matrix & restricted_layer = grid_map["restricted"];

  // Every iteration writes its own column
  #pragma omp parallel for
  for (int j = 0; j < size(1); ++j)
  {
    for (int i = 0; i < size(0); ++i)
    {
      const int c = owner(i, j);
      if (c < 0) {
        continue;
      }
      zone_layer(i, j) = owner_vehicle[c];
      priority_layer(i, j) = static_cast<float>(cells[c].priority);
      restricted_layer(i, j) = cells[c].restricted ? 1.0f : 0.0f;
    }
  }
}
