#include "hexalloc/grid_builder.hpp"
#include "hexalloc/exceptions.hpp"
#include <cmath>
#include <string>
#include <rclcpp/rclcpp.hpp>

namespace hexalloc
{

HexGridBuilder::HexGridBuilder(const GridBuilderOptions & options)
: options_(options)
{
  if (!(options_.cell_area > 0.0)) {
    throw InvalidGeometryError("Hex cell area must be positive, got " + std::to_string(options_.cell_area));
  }
  if (options_.sliver_threshold < 0.0) {
    throw InvalidGeometryError("Sliver threshold must not be negative, got " + std::to_string(options_.sliver_threshold));
  }
  if (options_.padding < 0) {
    throw InvalidGeometryError("Lattice padding must not be negative");
  }
  side_ = sideForArea(options_.cell_area);
}

std::vector<Eigen::Vector2d> HexGridBuilder::latticeCenters(const Box & bounds) const
{
  const double s = side_;
  const double col_step = s * std::sqrt(3.0);
  const double row_step = 1.5 * s;
  const double margin = options_.padding * s;

  const int r_min = static_cast<int>(std::floor((bounds.min_corner().y() - margin) / row_step)) - options_.padding;
  const int r_max = static_cast<int>(std::ceil((bounds.max_corner().y() + margin) / row_step)) + options_.padding;

  std::vector<Eigen::Vector2d> centers;
  for (int r = r_min; r <= r_max; ++r) {
    // Row r is shifted right by r/2 columns, so the q range follows the row
    const int q_min = static_cast<int>(std::floor((bounds.min_corner().x() - margin) / col_step - r / 2.0)) - options_.padding;
    const int q_max = static_cast<int>(std::ceil((bounds.max_corner().x() + margin) / col_step - r / 2.0)) + options_.padding;
    for (int q = q_min; q <= q_max; ++q) {
      centers.push_back(axialToXY(q, r, s));
    }
  }
  return centers;
}

std::vector<GridCell> HexGridBuilder::build(const Polygon & boundary) const
{
  auto logger = rclcpp::get_logger("hexalloc.grid_builder");

  Polygon farm = boundary;
  bg::unique(farm);
  bg::correct(farm);
  // A closed ring repeats its first vertex
  if (farm.outer().size() < 4) {
    throw InvalidGeometryError("Boundary needs at least three distinct vertices");
  }

  Box bounds;
  bg::envelope(farm, bounds);
  const double width = bounds.max_corner().x() - bounds.min_corner().x();
  const double height = bounds.max_corner().y() - bounds.min_corner().y();
  if (!(width > 0.0) || !(height > 0.0)) {
    RCLCPP_WARN(logger, "Boundary bounding box is degenerate (%.3f x %.3f m). No cells generated.", width, height);
    return {};
  }

  std::vector<Eigen::Vector2d> centers = latticeCenters(bounds);
  if (centers.empty()) {
    return {};
  }

  // Shift the lattice so its mean center sits on the bounding box center
  Eigen::Vector2d mean = Eigen::Vector2d::Zero();
  for (const auto & c : centers) {
    mean += c;
  }
  mean /= static_cast<double>(centers.size());
  const Eigen::Vector2d farm_center(
    (bounds.min_corner().x() + bounds.max_corner().x()) / 2.0,
    (bounds.min_corner().y() + bounds.max_corner().y()) / 2.0);
  const Eigen::Vector2d offset = farm_center - mean;

  std::vector<GridCell> cells;
  size_t slivers = 0;
  for (const auto & raw_center : centers) {
    const Eigen::Vector2d center = raw_center + offset;
    const Polygon hexagon = hexagonPolygon(center, side_);
    if (!bg::intersects(hexagon, farm)) {
      continue;
    }

    MultiPolygon clipped;
    bg::intersection(hexagon, farm, clipped);
    const double area = bg::area(clipped);

    const bool keep = options_.ignore_slivers ? area > options_.sliver_threshold : area > 0.0;
    if (!keep) {
      ++slivers;
      continue;
    }

    GridCell cell;
    cell.id = cells.size();
    cell.center = center;
    cell.polygon = std::move(clipped);
    cell.area = area;
    cells.push_back(std::move(cell));
  }

  RCLCPP_DEBUG(logger, "Lattice of %zu hexagons (side %.3f m) produced %zu cells, %zu slivers dropped.",
    centers.size(), side_, cells.size(), slivers);
  return cells;
}

}  // namespace hexalloc
