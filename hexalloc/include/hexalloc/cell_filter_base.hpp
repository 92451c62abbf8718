#ifndef HEXALLOC_CELL_FILTER_BASE_HPP_
#define HEXALLOC_CELL_FILTER_BASE_HPP_

#include <memory>
#include <string>
#include <vector>
#include <rclcpp/rclcpp.hpp>
#include "hexalloc/planning_context.hpp"

namespace hexalloc
{
class CellFilterBase
{
public:
  using Ptr = std::shared_ptr<CellFilterBase>;

  virtual ~CellFilterBase() = default;

  virtual void initialize(const std::string & name, rclcpp::Node * node) = 0;

  // Returns the cell set that replaces context.cells
  virtual std::vector<GridCell> filter(const PlanningContext & context) = 0;
};
}  // namespace hexalloc

#endif  // HEXALLOC_CELL_FILTER_BASE_HPP_
