#include "hexalloc/default_filters.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <pluginlib/class_list_macros.hpp>

namespace hexalloc
{

void CenterInsideFilter::initialize(const std::string & name, rclcpp::Node * node)
{
  name_ = name;
  node_ = node;
  // Fall back to the unfiltered cells below this kept fraction
  node_->declare_parameter(name_ + ".min_keep_ratio", 0.8);
}

std::vector<GridCell> CenterInsideFilter::filter(const PlanningContext & context)
{
  double min_keep_ratio = node_->get_parameter(name_ + ".min_keep_ratio").as_double();

  std::vector<GridCell> kept;
  kept.reserve(context.cells.size());
  for (const auto & cell : context.cells) {
    if (bg::within(toPoint(cell.center), context.boundary)) {
      kept.push_back(cell);
    }
  }

  if (static_cast<double>(kept.size()) < min_keep_ratio * static_cast<double>(context.cells.size())) {
    RCLCPP_WARN(node_->get_logger(), "Cell filter [%s] kept only %zu of %zu cells. Keeping all cells.",
      name_.c_str(), kept.size(), context.cells.size());
    return context.cells;
  }

  RCLCPP_INFO(node_->get_logger(), "Hexes after centroid-inside filter: %zu", kept.size());
  return kept;
}

void RandomPriorityFilter::initialize(const std::string & name, rclcpp::Node * node)
{
  name_ = name;
  node_ = node;
  node_->declare_parameter(name_ + ".high_priority_fraction", 0.05);
  node_->declare_parameter(name_ + ".seed", 42);
}

std::vector<GridCell> RandomPriorityFilter::filter(const PlanningContext & context)
{
  double fraction = node_->get_parameter(name_ + ".high_priority_fraction").as_double();
  auto seed = node_->get_parameter(name_ + ".seed").as_int();

  if (fraction < 0.0 || fraction > 1.0) {
    RCLCPP_WARN(node_->get_logger(), "Cell filter [%s] has high_priority_fraction %f outside [0, 1]. Clamping.",
      name_.c_str(), fraction);
    fraction = std::clamp(fraction, 0.0, 1.0);
  }

  std::vector<GridCell> cells = context.cells;
  for (auto & cell : cells) {
    cell.priority = kDefaultPriority;
  }
  if (cells.empty() || fraction == 0.0) {
    return cells;
  }

  size_t num_high = std::max<size_t>(1, static_cast<size_t>(std::floor(cells.size() * fraction)));

  std::vector<size_t> order(cells.size());
  std::iota(order.begin(), order.end(), 0);
  std::mt19937 gen(static_cast<std::mt19937::result_type>(seed));
  std::shuffle(order.begin(), order.end(), gen);

  for (size_t i = 0; i < num_high; ++i) {
    cells[order[i]].priority = kHighPriority;
  }
  return cells;
}

void RestrictedZoneFilter::initialize(const std::string & name, rclcpp::Node * node)
{
  name_ = name;
  node_ = node;
  node_->declare_parameter(name_ + ".zones", std::vector<std::string>());
}

std::vector<GridCell> RestrictedZoneFilter::filter(const PlanningContext & context)
{
  auto zone_wkts = node_->get_parameter(name_ + ".zones").as_string_array();

  std::vector<Polygon> zones;
  for (const auto & wkt : zone_wkts) {
    Polygon zone;
    try
    {
      bg::read_wkt(wkt, zone);
    }
    catch (const bg::read_wkt_exception & e)
    {
      RCLCPP_WARN(node_->get_logger(), "Cell filter [%s] could not parse zone \"%s\": %s. Skipping zone.",
        name_.c_str(), wkt.c_str(), e.what());
      continue;
    }
    bg::correct(zone);
    zones.push_back(std::move(zone));
  }

  std::vector<GridCell> cells = context.cells;
  size_t marked = 0;
  for (auto & cell : cells) {
    for (const auto & zone : zones) {
      if (bg::covered_by(toPoint(cell.center), zone)) {
        cell.restricted = true;
        ++marked;
        break;
      }
    }
  }
  RCLCPP_INFO(node_->get_logger(), "Cell filter [%s] marked %zu cells as restricted.", name_.c_str(), marked);
  return cells;
}

}  // namespace hexalloc

PLUGINLIB_EXPORT_CLASS(hexalloc::CenterInsideFilter, hexalloc::CellFilterBase)
PLUGINLIB_EXPORT_CLASS(hexalloc::RandomPriorityFilter, hexalloc::CellFilterBase)
PLUGINLIB_EXPORT_CLASS(hexalloc::RestrictedZoneFilter, hexalloc::CellFilterBase)
