#ifndef HEXALLOC_DEFAULT_FILTERS_HPP_
#define HEXALLOC_DEFAULT_FILTERS_HPP_

#include <string>
#include <vector>
#include "hexalloc/cell_filter_base.hpp"

namespace hexalloc
{

// Keeps cells whose center lies inside the boundary, unless that drops too many
class CenterInsideFilter : public CellFilterBase
{
public:
  void initialize(const std::string & name, rclcpp::Node * node) override;
  std::vector<GridCell> filter(const PlanningContext & context) override;

private:
  std::string name_;
  rclcpp::Node * node_;
};

// Marks a seeded random subset of the cells as high priority
class RandomPriorityFilter : public CellFilterBase
{
public:
  void initialize(const std::string & name, rclcpp::Node * node) override;
  std::vector<GridCell> filter(const PlanningContext & context) override;

private:
  std::string name_;
  rclcpp::Node * node_;
};

// Marks cells whose center falls in one of the configured WKT zones as restricted
class RestrictedZoneFilter : public CellFilterBase
{
public:
  void initialize(const std::string & name, rclcpp::Node * node) override;
  std::vector<GridCell> filter(const PlanningContext & context) override;

private:
  std::string name_;
  rclcpp::Node * node_;
};

}  // namespace hexalloc

#endif  // HEXALLOC_DEFAULT_FILTERS_HPP_
